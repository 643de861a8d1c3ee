//
// Rules.hpp
//

#ifndef HEXWAR_RULES_HPP
#define HEXWAR_RULES_HPP

#include <vector>
#include "Actions.hpp"
#include "Dice.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace hexwar::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Opens the first phase of a freshly built state.
        virtual auto BeginEpisode(GameState& state) -> void = 0;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& state, ActionRequest const& a) const -> CheckResult = 0;

        // Mutates the state for a request that passed Validate. Rolls come from dice;
        // deltas, attack and charge details are written into result.
        virtual auto Apply(GameState& state, Dice& dice, ActionRequest const& a, ActionResult& result) -> void = 0;

        // Prunes the pool, picks the next acting seat, walks the phase machine and
        // settles termination.
        virtual auto Advance(GameState& state) -> StepOutcome = 0;

        // Elimination and limit checks only; true once the episode is over.
        virtual auto CheckTermination(GameState& state) -> bool = 0;

        // Every request Validate would accept right now.
        virtual auto Enumerate(GameState const& state) const -> std::vector<ActionRequest> = 0;
    };
}

#endif //HEXWAR_RULES_HPP
