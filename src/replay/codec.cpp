//
// codec.cpp
//

#include "codec.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <utility>
#include <vector>

namespace hexwar::core::replay
{
    auto ToFbPhase(Phase const p) noexcept -> gen::log::Phase
    {
        switch (p)
        {
        case Phase::Move: return gen::log::Phase::Move;
        case Phase::Shoot: return gen::log::Phase::Shoot;
        case Phase::Charge: return gen::log::Phase::Charge;
        case Phase::Fight: return gen::log::Phase::Fight;
        case Phase::EndTurn: return gen::log::Phase::EndTurn;
        }
        return gen::log::Phase::Move;
    }

    auto FromFbPhase(gen::log::Phase const p) noexcept -> Phase
    {
        switch (p)
        {
        case gen::log::Phase::Move: return Phase::Move;
        case gen::log::Phase::Shoot: return Phase::Shoot;
        case gen::log::Phase::Charge: return Phase::Charge;
        case gen::log::Phase::Fight: return Phase::Fight;
        case gen::log::Phase::EndTurn: return Phase::EndTurn;
        }
        return Phase::Move;
    }

    auto ToFbKind(ActionKind const k) noexcept -> gen::log::ActionKind
    {
        switch (k)
        {
        case ActionKind::Move: return gen::log::ActionKind::Move;
        case ActionKind::Shoot: return gen::log::ActionKind::Shoot;
        case ActionKind::Charge: return gen::log::ActionKind::Charge;
        case ActionKind::Fight: return gen::log::ActionKind::Fight;
        case ActionKind::Pass: return gen::log::ActionKind::Pass;
        }
        return gen::log::ActionKind::Pass;
    }

    auto FromFbKind(gen::log::ActionKind const k) noexcept -> ActionKind
    {
        switch (k)
        {
        case gen::log::ActionKind::Move: return ActionKind::Move;
        case gen::log::ActionKind::Shoot: return ActionKind::Shoot;
        case gen::log::ActionKind::Charge: return ActionKind::Charge;
        case gen::log::ActionKind::Fight: return ActionKind::Fight;
        case gen::log::ActionKind::Pass: return ActionKind::Pass;
        }
        return ActionKind::Pass;
    }

    auto ToFbOutcome(StepOutcome const o) noexcept -> gen::log::StepOutcome
    {
        switch (o)
        {
        case StepOutcome::Rejected: return gen::log::StepOutcome::Rejected;
        case StepOutcome::Applied: return gen::log::StepOutcome::Applied;
        case StepOutcome::PhaseEnded: return gen::log::StepOutcome::PhaseEnded;
        case StepOutcome::TurnEnded: return gen::log::StepOutcome::TurnEnded;
        case StepOutcome::EpisodeEnded: return gen::log::StepOutcome::EpisodeEnded;
        }
        return gen::log::StepOutcome::Rejected;
    }

    auto FromFbOutcome(gen::log::StepOutcome const o) noexcept -> StepOutcome
    {
        switch (o)
        {
        case gen::log::StepOutcome::Rejected: return StepOutcome::Rejected;
        case gen::log::StepOutcome::Applied: return StepOutcome::Applied;
        case gen::log::StepOutcome::PhaseEnded: return StepOutcome::PhaseEnded;
        case gen::log::StepOutcome::TurnEnded: return StepOutcome::TurnEnded;
        case gen::log::StepOutcome::EpisodeEnded: return StepOutcome::EpisodeEnded;
        }
        return StepOutcome::Rejected;
    }
}

namespace
{
    using namespace hexwar::core;
    namespace fb = hexwar::gen::log;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(Phase::EndTurn) == static_cast<int>(fb::Phase::EndTurn));
    static_assert(static_cast<int>(ActionKind::Pass) == static_cast<int>(fb::ActionKind::Pass));
    static_assert(static_cast<int>(StepOutcome::EpisodeEnded) == static_cast<int>(fb::StepOutcome::EpisodeEnded));

    inline auto ToFbHex(Hex const h) -> fb::HexPos
    {
        return fb::HexPos{h.col, h.row};
    }

    inline auto FromFbHex(fb::HexPos const& h) -> Hex
    {
        return Hex{h.col(), h.row()};
    }

    template <typename E>
    inline auto InRange(E const e) -> bool
    {
        return static_cast<unsigned>(e) <= static_cast<unsigned>(E::MAX);
    }

    auto OptString(flatbuffers::FlatBufferBuilder& fbb, std::string const& s) -> flatbuffers::Offset<flatbuffers::String>
    {
        return s.empty() ? flatbuffers::Offset<flatbuffers::String>{} : fbb.CreateString(s);
    }

    auto BuildScenario(flatbuffers::FlatBufferBuilder& fbb, Scenario const& sc) -> flatbuffers::Offset<fb::Scenario>
    {
        std::vector<fb::HexPos> walls;
        walls.reserve(sc.walls.size());
        for (Hex const& w : sc.walls) walls.push_back(ToFbHex(w));
        auto const walls_off = fbb.CreateVectorOfStructs(walls);

        std::vector<flatbuffers::Offset<fb::Weapon>> armory;
        for (WeaponProfile const& w : sc.armory.Weapons())
        {
            auto const name = fbb.CreateString(w.name);
            armory.push_back(fb::CreateWeapon(fbb, name, w.range, w.attacks, w.skill, w.strength, w.ap, w.damage));
        }
        auto const armory_off = fbb.CreateVector(armory);

        std::vector<flatbuffers::Offset<fb::UnitTemplate>> profiles;
        for (UnitTemplate const& t : sc.profiles)
        {
            auto const name = fbb.CreateString(t.name);
            auto const ranged = OptString(fbb, t.ranged);
            auto const melee = OptString(fbb, t.melee);
            profiles.push_back(fb::CreateUnitTemplate(fbb, name, t.max_hp, t.move, t.toughness, t.armor_save,
                                                      t.invul_save, t.models, t.blocks_los, ranged, melee));
        }
        auto const profiles_off = fbb.CreateVector(profiles);

        std::vector<flatbuffers::Offset<fb::Placement>> units;
        for (Placement const& p : sc.units)
        {
            auto const profile = fbb.CreateString(p.profile);
            fb::HexPos const pos = ToFbHex(p.pos);
            units.push_back(fb::CreatePlacement(fbb, p.id, p.player, profile, &pos));
        }
        auto const units_off = fbb.CreateVector(units);

        return fb::CreateScenario(fbb, sc.cols, sc.rows, walls_off, armory_off, profiles_off, units_off);
    }

    auto BuildRecord(flatbuffers::FlatBufferBuilder& fbb, ActionRecord const& rec) -> flatbuffers::Offset<fb::ActionRecord>
    {
        ActionResult const& r = rec.result;

        std::vector<fb::UnitDelta> deltas;
        deltas.reserve(r.deltas.size());
        for (UnitDelta const& d : r.deltas)
        {
            deltas.emplace_back(d.unit, ToFbHex(d.from), ToFbHex(d.to), d.hp_before, d.hp_after);
        }
        auto const deltas_off = fbb.CreateVectorOfStructs(deltas);

        flatbuffers::Offset<fb::AttackSummary> attack_off{};
        if (r.attack)
        {
            std::vector<fb::AttackRoll> rolls;
            rolls.reserve(r.attack->rolls.size());
            for (AttackRoll const& a : r.attack->rolls) rolls.emplace_back(a.hit, a.wound, a.save, a.damage);
            auto const rolls_off = fbb.CreateVectorOfStructs(rolls);
            attack_off = fb::CreateAttackSummary(fbb, r.attack->attacks, r.attack->hits, r.attack->wounds,
                                                 r.attack->damage, r.attack->killed, rolls_off);
        }

        flatbuffers::Offset<fb::ChargeSummary> charge_off{};
        if (r.charge)
        {
            charge_off = fb::CreateChargeSummary(fbb, r.charge->roll, r.charge->required, r.charge->success);
        }

        std::optional<fb::HexPos> target_hex{};
        if (rec.request.target_hex) target_hex = ToFbHex(*rec.request.target_hex);

        std::int32_t const target_unit = rec.request.target_unit ? static_cast<std::int32_t>(*rec.request.target_unit) : -1;
        std::int16_t const violation = r.violation ? static_cast<std::int16_t>(std::to_underlying(r.violation->code)) : -1;
        std::int8_t const winner = r.winner ? static_cast<std::int8_t>(*r.winner) : -1;

        return fb::CreateActionRecord(fbb, rec.step, rec.turn, replay::ToFbPhase(rec.phase), rec.player,
                                      rec.request.unit, replay::ToFbKind(rec.request.kind),
                                      target_hex ? &*target_hex : nullptr, target_unit,
                                      r.legal, violation, replay::ToFbOutcome(r.outcome),
                                      deltas_off, attack_off, charge_off,
                                      r.reward, r.terminal, r.truncated, winner);
    }

    auto DecodeWinner(std::int8_t const w) -> std::expected<std::optional<PlyrIdxT>, replay::ParseError>
    {
        if (w == -1) return std::optional<PlyrIdxT>{};
        if (w < 0 || w >= static_cast<std::int8_t>(constants::PlayerCount))
            return std::unexpected(replay::ParseError{std::format("Bad winner {}", w)});
        return std::optional<PlyrIdxT>{static_cast<PlyrIdxT>(w)};
    }

    auto DecodeScenario(fb::Scenario const& sc) -> std::expected<Scenario, replay::ParseError>
    {
        Scenario out{};
        out.cols = sc.cols();
        out.rows = sc.rows();

        if (sc.walls())
        {
            for (fb::HexPos const* w : *sc.walls()) out.walls.push_back(FromFbHex(*w));
        }

        if (sc.armory())
        {
            for (fb::Weapon const* w : *sc.armory())
            {
                WeaponProfile wp{w->name()->str(), w->range(), w->attacks(), w->skill(), w->strength(), w->ap(), w->damage()};
                try
                {
                    out.armory.Add(std::move(wp));
                }
                catch (error::ConfigurationError const& e)
                {
                    return std::unexpected(replay::ParseError{std::format("Armory rejected: {}", e.what())});
                }
            }
        }

        if (sc.profiles())
        {
            for (fb::UnitTemplate const* t : *sc.profiles())
            {
                out.profiles.push_back(UnitTemplate{
                    t->name()->str(), t->max_hp(), t->move(), t->toughness(), t->armor_save(),
                    t->invul_save(), t->models(), t->blocks_los(),
                    t->ranged() ? t->ranged()->str() : std::string{},
                    t->melee() ? t->melee()->str() : std::string{}
                });
            }
        }

        if (sc.units())
        {
            for (fb::Placement const* p : *sc.units())
            {
                if (!p->pos()) return std::unexpected(replay::ParseError{std::format("Unit {} without position", p->id())});
                out.units.push_back(Placement{p->id(), p->player(), p->profile()->str(), FromFbHex(*p->pos())});
            }
        }
        return out;
    }

    auto DecodeRecord(fb::ActionRecord const& r) -> std::expected<ActionRecord, replay::ParseError>
    {
        if (!InRange(r.phase()) || !InRange(r.kind()) || !InRange(r.outcome()))
            return std::unexpected(replay::ParseError{std::format("Record {} has an unknown enum value", r.step())});

        ActionRecord out{};
        out.step = r.step();
        out.turn = r.turn();
        out.phase = replay::FromFbPhase(r.phase());
        out.player = r.player();

        out.request.unit = r.unit();
        out.request.kind = replay::FromFbKind(r.kind());
        if (r.target_hex()) out.request.target_hex = FromFbHex(*r.target_hex());
        if (r.target_unit() >= 0)
        {
            if (r.target_unit() > std::numeric_limits<UnitIdT>::max())
                return std::unexpected(replay::ParseError{std::format("Record {} target id out of range", r.step())});
            out.request.target_unit = static_cast<UnitIdT>(r.target_unit());
        }

        ActionResult& res = out.result;
        res.legal = r.legal();
        if (r.violation() >= 0)
        {
            if (r.violation() > std::to_underlying(error::LastRuleViolationCode))
                return std::unexpected(replay::ParseError{std::format("Record {} unknown violation {}", r.step(), r.violation())});
            res.violation = error::RuleViolation{.code = static_cast<error::RuleViolationCode>(r.violation())};
        }
        res.outcome = replay::FromFbOutcome(r.outcome());

        if (r.deltas())
        {
            for (fb::UnitDelta const* d : *r.deltas())
            {
                res.deltas.push_back(UnitDelta{d->unit(), FromFbHex(d->from_hex()), FromFbHex(d->to_hex()),
                                               d->hp_before(), d->hp_after()});
            }
        }

        if (fb::AttackSummary const* a = r.attack())
        {
            AttackOutcome atk{};
            atk.attacks = a->attacks();
            atk.hits = a->hits();
            atk.wounds = a->wounds();
            atk.damage = a->damage();
            atk.killed = a->killed();
            atk.hit = atk.hits > 0;
            if (a->rolls())
            {
                for (fb::AttackRoll const* roll : *a->rolls())
                    atk.rolls.push_back(AttackRoll{roll->hit(), roll->wound(), roll->save(), roll->damage()});
            }
            res.attack = std::move(atk);
        }

        if (fb::ChargeSummary const* c = r.charge())
            res.charge = ChargeRoll{c->roll(), c->required(), c->success()};

        res.reward = r.reward();
        res.terminal = r.terminal();
        res.truncated = r.truncated();

        auto const winner = DecodeWinner(r.winner());
        if (!winner) return std::unexpected(winner.error());
        res.winner = *winner;
        return out;
    }
}

namespace hexwar::core::replay
{
    auto BuildReplay(ReplayLog const& log) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb{4096};

        auto const scenario_off = BuildScenario(fbb, log.scenario);

        std::vector<flatbuffers::Offset<fb::ActionRecord>> records;
        records.reserve(log.records.size());
        for (ActionRecord const& rec : log.records) records.push_back(BuildRecord(fbb, rec));
        auto const records_off = fbb.CreateVector(records);

        RewardConfig const& rw = log.rewards;
        fb::RewardWeights const weights{rw.illegal_action, rw.step, rw.damage_dealt, rw.kill, rw.win, rw.loss, rw.draw};

        auto const root = fb::CreateReplay(fbb, log.schema_version, log.seed, log.max_turns, log.max_steps,
                                           &weights, scenario_off, records_off,
                                           log.winner ? static_cast<std::int8_t>(*log.winner) : std::int8_t{-1},
                                           log.truncated);
        fb::FinishReplayBuffer(fbb, root);
        return fbb.Release();
    }

    auto BuildReplay(GameImpl const& g) -> flatbuffers::DetachedBuffer
    {
        if (!g.Settings().record_history)
            HXW_THROW(error::Code::Serialization, "Replay requested from a game that keeps no history");

        GameState const& s = g.State();
        ReplayLog log{};
        log.schema_version = SchemaVersion;
        log.seed = g.Seed();
        log.max_turns = s.max_turns;
        log.max_steps = s.max_steps;
        log.rewards = g.Settings().rewards;
        log.scenario = g.ScenarioInUse();
        log.records = g.History();
        log.winner = s.winner;
        log.truncated = s.truncated;
        return BuildReplay(log);
    }

    auto DecodeReplay(std::span<std::byte const> const bytes) -> std::expected<ReplayLog, ParseError>
    {
        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
            return std::unexpected(ParseError{"Buffer too small"});
        if (!fb::ReplayBufferHasIdentifier(data))
            return std::unexpected(ParseError{"Missing HXWR file identifier"});

        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyReplayBuffer(verifier))
            return std::unexpected(ParseError{"Replay buffer failed verification"});

        fb::Replay const* root = fb::GetReplay(data);
        if (root->schema_version() != SchemaVersion)
            return std::unexpected(ParseError{std::format("Unsupported schema version {}", root->schema_version())});

        ReplayLog log{};
        log.schema_version = root->schema_version();
        log.seed = root->seed();
        log.max_turns = root->max_turns();
        log.max_steps = root->max_steps();
        if (fb::RewardWeights const* w = root->rewards())
        {
            log.rewards = RewardConfig{w->illegal_action(), w->step(), w->damage_dealt(), w->kill(),
                                       w->win(), w->loss(), w->draw()};
        }

        auto scenario = DecodeScenario(*root->scenario());
        if (!scenario) return std::unexpected(scenario.error());
        log.scenario = std::move(*scenario);

        if (root->records())
        {
            log.records.reserve(root->records()->size());
            for (fb::ActionRecord const* r : *root->records())
            {
                auto rec = DecodeRecord(*r);
                if (!rec) return std::unexpected(rec.error());
                log.records.push_back(std::move(*rec));
            }
        }

        auto const winner = DecodeWinner(root->winner());
        if (!winner) return std::unexpected(winner.error());
        log.winner = *winner;
        log.truncated = root->truncated();
        return log;
    }

    auto WriteReplayFile(std::filesystem::path const& path, flatbuffers::DetachedBuffer const& buf) -> void
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            HXW_THROW(error::Code::Serialization, std::format("Cannot open {} for writing", path.string()));
        out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!out)
            HXW_THROW(error::Code::Serialization, std::format("Short write to {}", path.string()));
    }

    auto ReadReplayFile(std::filesystem::path const& path) -> std::expected<std::vector<std::byte>, ParseError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) return std::unexpected(ParseError{std::format("Cannot open {}", path.string())});

        std::vector<char> raw{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        std::vector<std::byte> bytes(raw.size());
        std::ranges::transform(raw, bytes.begin(), [](char const c) { return static_cast<std::byte>(c); });
        return bytes;
    }
}
