//
// Types.hpp
//

#ifndef HEXWAR_TYPES_HPP
#define HEXWAR_TYPES_HPP

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexwar::core::constants
{
    inline constexpr std::uint8_t PlayerCount = 2;
    inline constexpr int MaxChargeDistance = 12;
    inline constexpr int ChargeDice = 2;
    inline constexpr int MeleeRange = 1;
    inline constexpr int ImpossibleSave = 7;
}

namespace hexwar::core
{
    using PlyrIdxT = std::uint8_t;
    using UnitIdT = std::uint16_t;

    struct Hex
    {
        std::int32_t col{};
        std::int32_t row{};

        auto operator<=>(Hex const&) const = default;
    };

    enum class Phase : std::uint8_t
    {
        Move = 0,
        Shoot,
        Charge,
        Fight,
        EndTurn
    };

    enum class ActionKind : std::uint8_t
    {
        Move = 0,
        Shoot,
        Charge,
        Fight,
        Pass
    };

    struct WeaponProfile
    {
        std::string name;
        int range{1};       // hexes
        int attacks{1};     // per live model
        int skill{4};       // hit on D6 >= skill
        int strength{4};
        int ap{0};          // added to the target's armor save
        int damage{1};
    };

    struct UnitProfile
    {
        std::string name;
        int max_hp{1};
        int move{6};
        int toughness{4};
        int armor_save{4};
        int invul_save{0};  // 0 = none
        int models{1};
        bool blocks_los{false};
        std::optional<WeaponProfile> ranged;
        std::optional<WeaponProfile> melee;
    };

    using UnitProfileSP = std::shared_ptr<UnitProfile const>;

    struct Unit
    {
        UnitIdT id{};
        PlyrIdxT player{};
        Hex pos{};
        int hp{};
        UnitProfileSP profile;

        [[nodiscard]]
        auto Alive() const noexcept -> bool { return hp > 0; }

        // Models still standing, rounded up: a unit at 1 hp keeps one figure.
        [[nodiscard]]
        auto LiveModels() const noexcept -> int
        {
            if (hp <= 0 || !profile || profile->max_hp <= 0) return 0;
            return (hp * profile->models + profile->max_hp - 1) / profile->max_hp;
        }
    };

    struct UnitTurnFlags
    {
        bool moved{false};
        bool fled{false};
        bool shot{false};
        bool charged{false};
        bool fought{false};
    };

    struct RewardConfig
    {
        float illegal_action{-0.1f};
        float step{-0.005f};
        float damage_dealt{0.1f};   // per hp removed
        float kill{1.0f};
        float win{5.0f};
        float loss{-5.0f};
        float draw{0.0f};
    };

    struct Config
    {
        std::uint64_t seed{0x5eedULL};
        std::uint16_t max_turns{5};
        std::uint32_t max_steps{2000};
        // Keep an ActionRecord per Step (replay/forensics). Off for raw training throughput.
        bool record_history{true};
        bool log_violations{false};
        RewardConfig rewards{};
    };
}

template <>
struct std::hash<hexwar::core::Hex>
{
    auto operator()(hexwar::core::Hex const& h) const noexcept -> std::size_t
    {
        auto const c = static_cast<std::uint32_t>(h.col);
        auto const r = static_cast<std::uint32_t>(h.row);
        return std::hash<std::uint64_t>{}((static_cast<std::uint64_t>(c) << 32) | r);
    }
};

#endif //HEXWAR_TYPES_HPP
