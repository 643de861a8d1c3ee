//
// Actions.hpp
//

#ifndef HEXWAR_ACTIONS_HPP
#define HEXWAR_ACTIONS_HPP

#include "Types.hpp"
#include "Exception.hpp"

namespace hexwar::core
{
    struct ActionRequest
    {
        UnitIdT unit{};
        ActionKind kind{ActionKind::Pass};
        std::optional<Hex> target_hex{};
        std::optional<UnitIdT> target_unit{};

        auto operator==(ActionRequest const&) const -> bool = default;
    };

    enum class StepOutcome : std::uint8_t
    {
        Rejected,
        Applied,
        PhaseEnded,
        TurnEnded,
        EpisodeEnded
    };

    // One die sequence of an attack; 0 means the roll never happened.
    struct AttackRoll
    {
        std::uint8_t hit{};
        std::uint8_t wound{};
        std::uint8_t save{};
        int damage{};

        auto operator==(AttackRoll const&) const -> bool = default;
    };

    struct AttackOutcome
    {
        std::vector<AttackRoll> rolls;
        int attacks{};
        int hits{};
        int wounds{};
        int damage{};
        bool hit{false};
        bool killed{false};
    };

    struct ChargeRoll
    {
        int roll{};
        int required{};
        bool success{false};
    };

    struct UnitDelta
    {
        UnitIdT unit{};
        Hex from{};
        Hex to{};
        int hp_before{};
        int hp_after{};

        auto operator==(UnitDelta const&) const -> bool = default;
    };

    struct ActionResult
    {
        bool legal{false};
        std::optional<error::RuleViolation> violation{};
        StepOutcome outcome{StepOutcome::Rejected};
        std::vector<UnitDelta> deltas;
        std::optional<AttackOutcome> attack{};
        std::optional<ChargeRoll> charge{};
        float reward{};
        bool terminal{false};
        bool truncated{false};
        std::optional<PlyrIdxT> winner{};
    };

    // Single structured record per submitted request, accepted or rejected.
    struct ActionRecord
    {
        std::uint32_t step{};
        std::uint16_t turn{};
        Phase phase{};
        PlyrIdxT player{};
        ActionRequest request{};
        ActionResult result{};
    };

    inline auto to_string(ActionKind k) -> std::string_view
    {
        switch (k)
        {
        case ActionKind::Move: return "Move";
        case ActionKind::Shoot: return "Shoot";
        case ActionKind::Charge: return "Charge";
        case ActionKind::Fight: return "Fight";
        case ActionKind::Pass: return "Pass";
        }
        return "?";
    }

    inline auto to_string(StepOutcome o) -> std::string_view
    {
        switch (o)
        {
        case StepOutcome::Rejected: return "Rejected";
        case StepOutcome::Applied: return "Applied";
        case StepOutcome::PhaseEnded: return "PhaseEnded";
        case StepOutcome::TurnEnded: return "TurnEnded";
        case StepOutcome::EpisodeEnded: return "EpisodeEnded";
        }
        return "?";
    }
} // namespace hexwar::core

#endif //HEXWAR_ACTIONS_HPP
