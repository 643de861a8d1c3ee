//
// Replayer.cpp
//

#include "Replayer.hpp"

#include <format>
#include <memory>
#include "../core/Game.hpp"
#include "../core/TacticalRules.hpp"

namespace hexwar::core::replay
{
    namespace
    {
        auto Fmt(std::optional<error::RuleViolation> const& v) -> std::string
        {
            return v ? std::string{error::to_string(v->code)} : std::string{"none"};
        }

        auto Fmt(std::optional<PlyrIdxT> const& w) -> std::string
        {
            return w ? std::format("P{}", static_cast<int>(*w)) : std::string{"none"};
        }

        auto FmtDeltas(std::vector<UnitDelta> const& ds) -> std::string
        {
            std::string s;
            for (UnitDelta const& d : ds)
            {
                s += std::format("[u{} ({},{})->({},{}) hp {}->{}]", d.unit, d.from.col, d.from.row,
                                 d.to.col, d.to.row, d.hp_before, d.hp_after);
            }
            return s.empty() ? std::string{"[]"} : s;
        }

        auto FmtRolls(std::optional<AttackOutcome> const& a) -> std::string
        {
            if (!a) return "none";
            std::string s = std::format("dmg={} killed={} rolls=", a->damage, a->killed);
            for (AttackRoll const& r : a->rolls) s += std::format("{}/{}/{}:{} ", r.hit, r.wound, r.save, r.damage);
            return s;
        }

        auto FmtCharge(std::optional<ChargeRoll> const& c) -> std::string
        {
            if (!c) return "none";
            return std::format("roll={} need={} success={}", c->roll, c->required, c->success);
        }

        auto SameAttack(std::optional<AttackOutcome> const& a, std::optional<AttackOutcome> const& b) -> bool
        {
            if (a.has_value() != b.has_value()) return false;
            if (!a) return true;
            return a->attacks == b->attacks && a->hits == b->hits && a->wounds == b->wounds
                && a->damage == b->damage && a->killed == b->killed && a->rolls == b->rolls;
        }

        auto SameCharge(std::optional<ChargeRoll> const& a, std::optional<ChargeRoll> const& b) -> bool
        {
            if (a.has_value() != b.has_value()) return false;
            if (!a) return true;
            return a->roll == b->roll && a->required == b->required && a->success == b->success;
        }

        auto SameViolation(std::optional<error::RuleViolation> const& a,
                           std::optional<error::RuleViolation> const& b) -> bool
        {
            if (a.has_value() != b.has_value()) return false;
            return !a || a->code == b->code;
        }

        // Compares one logged record against its replayed result.
        auto Compare(std::size_t const index, ActionRecord const& logged, ActionRecord const& replayed)
            -> std::optional<Divergence>
        {
            auto diverge = [&](std::string field, std::string a, std::string b)
            {
                return Divergence{index, logged.step, std::move(field), std::move(a), std::move(b)};
            };

            ActionResult const& l = logged.result;
            ActionResult const& r = replayed.result;

            if (logged.step != replayed.step)
                return diverge("step", std::to_string(logged.step), std::to_string(replayed.step));
            if (logged.turn != replayed.turn)
                return diverge("turn", std::to_string(logged.turn), std::to_string(replayed.turn));
            if (logged.phase != replayed.phase)
                return diverge("phase", std::string{to_string(logged.phase)}, std::string{to_string(replayed.phase)});
            if (logged.player != replayed.player)
                return diverge("player", std::to_string(logged.player), std::to_string(replayed.player));
            if (l.legal != r.legal)
                return diverge("legal", std::format("{}", l.legal), std::format("{}", r.legal));
            if (!SameViolation(l.violation, r.violation))
                return diverge("violation", Fmt(l.violation), Fmt(r.violation));
            if (l.outcome != r.outcome)
                return diverge("outcome", std::string{to_string(l.outcome)}, std::string{to_string(r.outcome)});
            if (l.deltas != r.deltas)
                return diverge("deltas", FmtDeltas(l.deltas), FmtDeltas(r.deltas));
            if (!SameAttack(l.attack, r.attack))
                return diverge("attack", FmtRolls(l.attack), FmtRolls(r.attack));
            if (!SameCharge(l.charge, r.charge))
                return diverge("charge", FmtCharge(l.charge), FmtCharge(r.charge));
            if (l.reward != r.reward)
                return diverge("reward", std::format("{}", l.reward), std::format("{}", r.reward));
            if (l.terminal != r.terminal || l.truncated != r.truncated)
                return diverge("terminal", std::format("{}/{}", l.terminal, l.truncated),
                               std::format("{}/{}", r.terminal, r.truncated));
            if (l.winner != r.winner)
                return diverge("winner", Fmt(l.winner), Fmt(r.winner));
            return std::nullopt;
        }
    }

    auto VerifyReplay(ReplayLog const& log) -> std::expected<ReplaySummary, Divergence>
    {
        Config cfg{};
        cfg.seed = log.seed;
        cfg.max_turns = log.max_turns;
        cfg.max_steps = log.max_steps;
        cfg.rewards = log.rewards;
        cfg.record_history = true;

        GameImpl game(cfg, std::make_unique<TacticalRules>());
        (void)game.Reset(log.scenario);

        ReplaySummary summary{};
        for (std::size_t i{}; i < log.records.size(); ++i)
        {
            ActionRecord const& logged = log.records[i];
            (void)game.Step(logged.request);

            if (auto const d = Compare(i, logged, game.History().back()))
                return std::unexpected(*d);

            ++summary.records;
            if (!logged.result.legal) ++summary.rejected;
        }

        summary.winner = game.Winner();
        summary.terminal = game.Over();
        summary.truncated = game.Truncated();

        if (summary.winner != log.winner)
            return std::unexpected(Divergence{log.records.size(), game.Steps(), "final winner",
                                              Fmt(log.winner), Fmt(summary.winner)});
        if (summary.truncated != log.truncated)
            return std::unexpected(Divergence{log.records.size(), game.Steps(), "final truncated",
                                              std::format("{}", log.truncated), std::format("{}", summary.truncated)});
        return summary;
    }

    auto describe(Divergence const& d) -> std::string
    {
        return std::format("record {} (step {}): {} logged={} replayed={}", d.index, d.step, d.field, d.logged, d.replayed);
    }
}
