//
// Exception.hpp
//

#ifndef HEXWAR_EXCEPTION_HPP
#define HEXWAR_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace hexwar::core
{
    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Move: return "Move";
        case Phase::Shoot: return "Shoot";
        case Phase::Charge: return "Charge";
        case Phase::Fight: return "Fight";
        case Phase::EndTurn: return "EndTurn";
        }
        return "?";
    }
}

namespace hexwar::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Configuration, // scenario/armory rejected at load time
        State, // state machine misuse (not an illegal player action)
        InvalidAction, // action cannot be applied although it was validated
        Invariant, // impossible game state detected at runtime
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvariantError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg, std::string dump = {},
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, std::move(dump), loc);
        case Code::Configuration: throw ConfigurationError(std::move(msg), c, std::move(dump), loc);
        case Code::State: throw StateError(std::move(msg), c, std::move(dump), loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, std::move(dump), loc);
        case Code::Invariant: throw InvariantError(std::move(msg), c, std::move(dump), loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, std::move(dump), loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, std::move(dump), loc);
        }
        throw std::runtime_error(msg);
    }

#define HXW_THROW(code_enum, msg) ::hexwar::core::error::fail((code_enum), (msg))
#define HXW_THROW_DUMP(code_enum, msg, dump) ::hexwar::core::error::fail((code_enum), (msg), (dump))
#define HXW_ASSERT(cond, msg) do { if(!(cond)) ::hexwar::core::error::fail(::hexwar::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        EpisodeOver,
        UnknownUnit,
        UnitDead,
        WrongPlayer,
        WrongPhase,
        AlreadyActed,
        NotEligible,
        MissingTargetHex,
        MissingTargetUnit,

        // Move
        Move_OutOfBounds,
        Move_DestinationWall,
        Move_DestinationIsOrigin,
        Move_DestinationOccupied,
        Move_Unreachable,
        Move_DestinationAdjacentToEnemy,

        // Shoot
        Shoot_NoRangedWeapon,
        Shoot_UnitFled,
        Shoot_ShooterEngaged,
        Shoot_TargetNotFound,
        Shoot_TargetDead,
        Shoot_TargetFriendly,
        Shoot_OutOfRange,
        Shoot_NoLineOfSight,

        // Charge
        Charge_NoMeleeWeapon,
        Charge_UnitFled,
        Charge_AlreadyEngaged,
        Charge_TargetNotFound,
        Charge_TargetDead,
        Charge_TargetFriendly,
        Charge_TargetTooFar,
        Charge_OutOfBounds,
        Charge_DestinationWall,
        Charge_DestinationOccupied,
        Charge_DestinationNotAdjacentToTarget,
        Charge_Unreachable,
        Charge_NoReachableDestination,

        // Fight
        Fight_NoMeleeWeapon,
        Fight_TargetNotFound,
        Fight_TargetDead,
        Fight_TargetFriendly,
        Fight_TargetNotAdjacent,
        Fight_ChargersStrikeFirst
    };
    // Keep in step with the last enumerator above; replay decoding range-checks against it.
    inline constexpr RuleViolationCode LastRuleViolationCode = RuleViolationCode::Fight_ChargersStrikeFirst;

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<UnitIdT> unit{};
        std::optional<UnitIdT> target{};
        std::optional<Hex> hex{};
        std::optional<int> distance{};
        std::optional<int> limit{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_unit(UnitIdT u) -> RuleViolation&
        {
            unit = u;
            return *this;
        }

        auto with_target(UnitIdT t) -> RuleViolation&
        {
            target = t;
            return *this;
        }

        auto with_hex(Hex h) -> RuleViolation&
        {
            hex = h;
            return *this;
        }

        auto with_distance(int d) -> RuleViolation&
        {
            distance = d;
            return *this;
        }

        auto with_limit(int l) -> RuleViolation&
        {
            limit = l;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::EpisodeOver: return "Episode already over";
        case E::UnknownUnit: return "Unknown unit id";
        case E::UnitDead: return "Unit is dead";
        case E::WrongPlayer: return "Unit belongs to the player not holding the initiative";
        case E::WrongPhase: return "Action kind not allowed in this phase";
        case E::AlreadyActed: return "Unit already acted this phase";
        case E::NotEligible: return "Unit not eligible this phase";
        case E::MissingTargetHex: return "Target hex required";
        case E::MissingTargetUnit: return "Target unit required";

        // Move
        case E::Move_OutOfBounds: return "Move: destination out of bounds";
        case E::Move_DestinationWall: return "Move: destination is a wall";
        case E::Move_DestinationIsOrigin: return "Move: destination equals origin";
        case E::Move_DestinationOccupied: return "Move: destination occupied";
        case E::Move_Unreachable: return "Move: no legal path within range";
        case E::Move_DestinationAdjacentToEnemy: return "Move: cannot end adjacent to an enemy";

        // Shoot
        case E::Shoot_NoRangedWeapon: return "Shoot: unit has no ranged weapon";
        case E::Shoot_UnitFled: return "Shoot: unit fled this turn";
        case E::Shoot_ShooterEngaged: return "Shoot: shooter engaged in melee";
        case E::Shoot_TargetNotFound: return "Shoot: unknown target";
        case E::Shoot_TargetDead: return "Shoot: target is dead";
        case E::Shoot_TargetFriendly: return "Shoot: target is friendly";
        case E::Shoot_OutOfRange: return "Shoot: target out of range";
        case E::Shoot_NoLineOfSight: return "Shoot: no line of sight";

        // Charge
        case E::Charge_NoMeleeWeapon: return "Charge: unit has no melee weapon";
        case E::Charge_UnitFled: return "Charge: unit fled this turn";
        case E::Charge_AlreadyEngaged: return "Charge: unit already engaged";
        case E::Charge_TargetNotFound: return "Charge: unknown target";
        case E::Charge_TargetDead: return "Charge: target is dead";
        case E::Charge_TargetFriendly: return "Charge: target is friendly";
        case E::Charge_TargetTooFar: return "Charge: target beyond charge reach";
        case E::Charge_OutOfBounds: return "Charge: destination out of bounds";
        case E::Charge_DestinationWall: return "Charge: destination is a wall";
        case E::Charge_DestinationOccupied: return "Charge: destination occupied";
        case E::Charge_DestinationNotAdjacentToTarget: return "Charge: destination not adjacent to target";
        case E::Charge_Unreachable: return "Charge: no legal path within charge reach";
        case E::Charge_NoReachableDestination: return "Charge: no reachable hex next to target";

        // Fight
        case E::Fight_NoMeleeWeapon: return "Fight: unit has no melee weapon";
        case E::Fight_TargetNotFound: return "Fight: unknown target";
        case E::Fight_TargetDead: return "Fight: target is dead";
        case E::Fight_TargetFriendly: return "Fight: target is friendly";
        case E::Fight_TargetNotAdjacent: return "Fight: target not adjacent";
        case E::Fight_ChargersStrikeFirst: return "Fight: units that charged this turn strike first";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.unit) s += std::format(" | unit={}", *v.unit);
        if (v.target) s += std::format(" | target={}", *v.target);
        if (v.hex) s += std::format(" | hex=({},{})", v.hex->col, v.hex->row);
        if (v.distance) s += std::format(" | dist={}", *v.distance);
        if (v.limit) s += std::format(" | limit={}", *v.limit);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    // Strict lookup miss (armory, profile registry). Never replaced by a default.
    struct LookupError
    {
        std::string key;
        std::string where;
    };
}

#endif //HEXWAR_EXCEPTION_HPP
