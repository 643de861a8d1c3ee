//
// Combat.hpp
//

#ifndef HEXWAR_COMBAT_HPP
#define HEXWAR_COMBAT_HPP

#include "Actions.hpp"
#include "Dice.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace hexwar::core::combat
{
    // D6 needed to wound for a strength/toughness pair.
    [[nodiscard]]
    constexpr auto WoundTarget(int const strength, int const toughness) noexcept -> int
    {
        if (strength >= 2 * toughness) return 2;
        if (strength > toughness) return 3;
        if (strength == toughness) return 4;
        if (2 * strength <= toughness) return 6;
        return 5;
    }

    // Best of armor (worsened by ap) and invulnerable, kept within 2..6.
    [[nodiscard]]
    constexpr auto SaveTarget(int const armor_save, int const ap, int const invul_save) noexcept -> int
    {
        int const armor = armor_save + ap;
        int const invul = invul_save > 0 ? invul_save : constants::ImpossibleSave;
        int const best = armor < invul ? armor : invul;
        return best < 2 ? 2 : (best > 6 ? 6 : best);
    }

    // Ranged preconditions: weapon, live hostile target, shooter not engaged,
    // within weapon range and in sight. No state change.
    auto CheckShot(GameState const& state, Unit const& shooter, UnitIdT target_id) -> error::ValidateResult;

    // Melee preconditions: weapon, live hostile adjacent target.
    auto CheckFight(GameState const& state, Unit const& attacker, UnitIdT target_id) -> error::ValidateResult;

    // Full hit/wound/save/damage sequence. Only target.hp changes; stops as soon
    // as the target is dead. Rolls are drawn from dice in a fixed order.
    auto ResolveAttacks(Unit const& attacker, Unit& target, WeaponProfile const& weapon, Dice& dice) -> AttackOutcome;
}

#endif //HEXWAR_COMBAT_HPP
