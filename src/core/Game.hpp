//
// Game.hpp
//

#ifndef HEXWAR_GAME_HPP
#define HEXWAR_GAME_HPP

#include <memory>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Dice.hpp"
#include "State.hpp"
#include "Rules.hpp"
#include "Scenario.hpp"

namespace hexwar::core::debug {struct Inspector;}
namespace hexwar::core
{
    // Owns one episode: scenario, state, dice and the action history.
    // Nothing mutable is shared with other instances.
    class GameImpl
    {
    public:
        static constexpr std::size_t GlobalFeatures = 6;
        static constexpr std::size_t UnitFeatures = 9;

        GameImpl() = delete;
        GameImpl(Config const& config, std::unique_ptr<Rules> rules);

        // Fresh episode. seed overrides Config::seed when given. Throws
        // ConfigurationError on a malformed scenario. Returns the first observation.
        auto Reset(Scenario const& scenario, std::optional<std::uint64_t> seed = std::nullopt) -> std::vector<float>;

        // One request through validate/apply/advance. Illegal requests come back
        // as a rejected result and leave the state untouched.
        auto Step(ActionRequest const& request) -> ActionResult;

        [[nodiscard]] auto Observe() const -> std::vector<float>;
        [[nodiscard]] auto ObservationSize() const noexcept -> std::size_t;
        [[nodiscard]] auto LegalActions() const -> std::vector<ActionRequest>;
        auto SnapshotFor(PlyrIdxT seat) const -> std::shared_ptr<GameSnapshot const>;

        auto History() const noexcept -> std::vector<ActionRecord> const& { return history_; }
        auto State() const noexcept -> GameState const& { return state_; }
        auto ScenarioInUse() const noexcept -> Scenario const& { return scenario_; }
        auto Settings() const noexcept -> Config const& { return cfg_; }
        auto Seed() const noexcept -> std::uint64_t { return dice_.Seed(); }

        auto CurrentPlayer() const noexcept -> PlyrIdxT { return state_.current_player; }
        // Differs from CurrentPlayer only while both sides trade blows in the Fight phase.
        auto ActingPlayer() const noexcept -> PlyrIdxT { return state_.acting_player; }
        auto PhaseNow() const noexcept -> Phase { return state_.phase; }
        auto Turn() const noexcept -> std::uint16_t { return state_.turn; }
        auto Steps() const noexcept -> std::uint32_t { return state_.steps; }
        auto Over() const noexcept -> bool { return state_.over; }
        auto Truncated() const noexcept -> bool { return state_.truncated; }
        auto Winner() const noexcept -> std::optional<PlyrIdxT> { return state_.winner; }
        // Set once an invariant check failed; the episode cannot continue.
        auto Halted() const noexcept -> bool { return halted_; }

        //allows class to directly access private data on an instance
        friend struct debug::Inspector;

    private:
        auto Reward(ActionResult const& result, PlyrIdxT actor, bool ended_now) const -> float;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        Dice dice_;

        Scenario scenario_{};
        GameState state_{};
        std::vector<ActionRecord> history_;

        bool ready_{false};
        bool halted_{false};
    };
}
#endif //HEXWAR_GAME_HPP
