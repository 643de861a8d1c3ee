//
// Scenario.hpp
//

#ifndef HEXWAR_SCENARIO_HPP
#define HEXWAR_SCENARIO_HPP

#include <expected>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace hexwar::core
{
    // Named weapon table. Lookups are strict: a miss is an error, never a default.
    class Armory
    {
    public:
        // Throws ConfigurationError on a duplicate name or nonsensical stats.
        auto Add(WeaponProfile weapon) -> void;

        [[nodiscard]]
        auto Find(std::string_view name) const -> std::expected<WeaponProfile const*, error::LookupError>;

        auto Weapons() const noexcept -> std::vector<WeaponProfile> const& { return weapons_; }
        auto Size() const noexcept -> std::size_t { return weapons_.size(); }

    private:
        std::vector<WeaponProfile> weapons_;
    };

    // Unit profile as written in a scenario: weapons by armory name, empty = none.
    struct UnitTemplate
    {
        std::string name;
        int max_hp{1};
        int move{6};
        int toughness{4};
        int armor_save{4};
        int invul_save{0};
        int models{1};
        bool blocks_los{false};
        std::string ranged;
        std::string melee;
    };

    struct Placement
    {
        UnitIdT id{};
        PlyrIdxT player{};
        std::string profile;
        Hex pos{};
    };

    struct Scenario
    {
        int cols{};
        int rows{};
        std::vector<Hex> walls;
        Armory armory;
        std::vector<UnitTemplate> profiles;
        std::vector<Placement> units;  // order is the unit slot order

        [[nodiscard]]
        auto FindProfile(std::string_view name) const -> std::expected<UnitTemplate const*, error::LookupError>;
    };

    // Resolves weapon references against the armory. Throws ConfigurationError.
    auto ResolveProfile(UnitTemplate const& tmpl, Armory const& armory) -> UnitProfileSP;

    // Validates the scenario and limits and builds turn 1 / Move / player 0.
    // The activation pool is left empty; the rules open the first phase.
    auto BuildInitialState(Scenario const& scenario, Config const& config) -> GameState;

    // Built-in 25x21 skirmish, three units a side.
    auto DefaultScenario() -> Scenario;
}

#endif //HEXWAR_SCENARIO_HPP
