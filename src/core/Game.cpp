//
// Game.cpp
//

#include "Game.hpp"

#include <print>
#include <utility>
#include "../debug/Invariants.hpp"

namespace hexwar::core
{
    GameImpl::GameImpl(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(std::move(rules)),
        dice_{cfg_.seed}
    {
        HXW_ASSERT(rules_ != nullptr, "Invalid rules in core");
    }

    auto GameImpl::Reset(Scenario const& scenario, std::optional<std::uint64_t> const seed) -> std::vector<float>
    {
        // Build first so a rejected scenario leaves the previous episode intact.
        GameState next = BuildInitialState(scenario, cfg_);

        if (seed) cfg_.seed = *seed;
        scenario_ = scenario;
        dice_ = Dice{cfg_.seed};
        state_ = std::move(next);
        history_.clear();
        halted_ = false;

        rules_->BeginEpisode(state_);
        ready_ = true;

        debug::CheckInvariants(*this);
        return Observe();
    }

    auto GameImpl::Step(ActionRequest const& request) -> ActionResult
    {
        if (!ready_) HXW_THROW(error::Code::State, "Step before Reset");
        if (halted_) HXW_THROW(error::Code::State, "Step on an episode halted by an invariant failure");

        Phase const phase = state_.phase;
        PlyrIdxT const actor = state_.acting_player;
        std::uint16_t const turn = state_.turn;
        std::uint32_t const step_index = state_.steps;
        bool const was_over = state_.over;

        ActionResult result{};
        auto const check = rules_->Validate(state_, request);
        if (!was_over) ++state_.steps;

        if (!check)
        {
            result.legal = false;
            result.violation = check.error();
            result.outcome = StepOutcome::Rejected;
            if (cfg_.log_violations)
            {
                std::print("[hexwar] step {} P{} rejected: {}\n",
                           step_index, static_cast<int>(actor), error::describe(check.error()));
            }
            // A rejected request still spends a step and can hit the step limit.
            if (!was_over) (void)rules_->CheckTermination(state_);
        }
        else
        {
            result.legal = true;
            rules_->Apply(state_, dice_, request, result);
            result.outcome = rules_->Advance(state_);
        }

        result.terminal = state_.over;
        result.truncated = state_.truncated;
        result.winner = state_.winner;
        result.reward = Reward(result, actor, !was_over && state_.over);

        if (cfg_.record_history)
            history_.push_back(ActionRecord{step_index, turn, phase, actor, request, result});

        if (result.legal)
        {
            try
            {
                debug::CheckInvariants(*this);
            }
            catch (error::InvariantError const&)
            {
                halted_ = true;
                throw;
            }
        }
        return result;
    }

    auto GameImpl::Reward(ActionResult const& result, PlyrIdxT const actor, bool const ended_now) const -> float
    {
        RewardConfig const& rw = cfg_.rewards;
        float r{};
        if (!result.legal)
        {
            r += rw.illegal_action;
        }
        else
        {
            r += rw.step;
            if (result.attack)
            {
                r += rw.damage_dealt * static_cast<float>(result.attack->damage);
                if (result.attack->killed) r += rw.kill;
            }
        }

        if (ended_now)
        {
            if (!state_.winner) r += rw.draw;
            else if (*state_.winner == actor) r += rw.win;
            else r += rw.loss;
        }
        return r;
    }

    auto GameImpl::ObservationSize() const noexcept -> std::size_t
    {
        return GlobalFeatures + UnitFeatures * state_.units.size();
    }

    auto GameImpl::Observe() const -> std::vector<float>
    {
        std::vector<float> obs;
        obs.reserve(ObservationSize());

        for (Phase const p : {Phase::Move, Phase::Shoot, Phase::Charge, Phase::Fight})
            obs.push_back(state_.phase == p ? 1.0f : 0.0f);
        obs.push_back(static_cast<float>(state_.current_player));
        obs.push_back(state_.max_turns > 0
                          ? static_cast<float>(state_.turn) / static_cast<float>(state_.max_turns)
                          : 0.0f);

        float const cols = state_.board ? static_cast<float>(state_.board->Cols()) : 1.0f;
        float const rows = state_.board ? static_cast<float>(state_.board->Rows()) : 1.0f;

        for (std::size_t slot{}; slot < state_.units.size(); ++slot)
        {
            Unit const& u = state_.units[slot];
            UnitTurnFlags const& f = state_.flags[slot];
            UnitProfile const& p = *u.profile;

            obs.push_back(u.Alive() ? 1.0f : 0.0f);
            obs.push_back(u.player == state_.current_player ? 1.0f : 0.0f);
            obs.push_back(static_cast<float>(u.pos.col) / cols);
            obs.push_back(static_cast<float>(u.pos.row) / rows);
            obs.push_back(static_cast<float>(u.hp) / static_cast<float>(p.max_hp));
            obs.push_back(static_cast<float>(u.LiveModels()) / static_cast<float>(p.models));
            obs.push_back(f.moved ? 1.0f : 0.0f);
            obs.push_back(f.fled ? 1.0f : 0.0f);
            obs.push_back(state_.InPool(slot) ? 1.0f : 0.0f);
        }
        return obs;
    }

    auto GameImpl::LegalActions() const -> std::vector<ActionRequest>
    {
        if (!ready_) return {};
        return rules_->Enumerate(state_);
    }

    auto GameImpl::SnapshotFor(PlyrIdxT const seat) const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->seat = seat;
        snap->current_player = state_.current_player;
        snap->acting_player = state_.acting_player;
        snap->phase = state_.phase;
        snap->turn = state_.turn;
        snap->board_cols = state_.board ? state_.board->Cols() : 0;
        snap->board_rows = state_.board ? state_.board->Rows() : 0;
        snap->units = state_.units;
        if (seat == state_.acting_player && !state_.over) snap->legal = LegalActions();
        return snap;
    }
}
