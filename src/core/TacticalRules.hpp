//
// TacticalRules.hpp
//

#ifndef HEXWAR_TACTICALRULES_HPP
#define HEXWAR_TACTICALRULES_HPP

#include <optional>
#include "Rules.hpp"

namespace hexwar::core
{
    struct ChargePlan
    {
        Hex destination{};
        int distance{};
    };

    // Move -> Shoot -> Charge -> Fight -> EndTurn for each player in turn.
    // The Fight phase involves both players: units that charged this turn strike first,
    // then engaged units alternate, starting with the player who does not own the turn.
    class TacticalRules final : public Rules
    {
    public:
        auto BeginEpisode(GameState& state) -> void override;
        auto Validate(GameState const& state, ActionRequest const& a) const -> CheckResult override;
        auto Apply(GameState& state, Dice& dice, ActionRequest const& a, ActionResult& result) -> void override;
        auto Advance(GameState& state) -> StepOutcome override;
        auto CheckTermination(GameState& state) -> bool override;
        auto Enumerate(GameState const& state) const -> std::vector<ActionRequest> override;

        // Whether the unit in slot may still act in the current phase.
        static auto Eligible(GameState const& state, std::size_t slot) -> bool;

        // Turn-owner units that charged and are still waiting to fight.
        static auto ChargersPending(GameState const& state) -> bool;

        // Pool member that may submit the very next request.
        static auto CanActNow(GameState const& state, std::size_t slot) -> bool;

        // Nearest free hex next to target the charger can reach within charge range;
        // ties broken by (col,row).
        static auto PickChargeDestination(GameState const& state, Unit const& charger, Unit const& target)
            -> std::optional<ChargePlan>;

        static auto NextPhase(Phase p) noexcept -> Phase;

    private:
        static auto OpenPhase(GameState& state) -> void;
        static auto PickActingPlayer(GameState& state) -> void;
        static auto FinishByUnitCount(GameState& state, bool truncated) -> void;
        static auto ValidateMove(GameState const& state, Unit const& u, ActionRequest const& a) -> CheckResult;
        static auto ValidateCharge(GameState const& state, Unit const& u, ActionRequest const& a) -> CheckResult;
    };
}

#endif //HEXWAR_TACTICALRULES_HPP
