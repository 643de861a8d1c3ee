//
// Scenario.cpp
//

#include "Scenario.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include "Board.hpp"

namespace hexwar::core
{
    namespace
    {
        auto CheckWeapon(WeaponProfile const& w) -> void
        {
            if (w.name.empty())
                HXW_THROW(error::Code::Configuration, "Weapon without a name");
            if (w.range < 1 || w.attacks < 1 || w.strength < 1 || w.damage < 1 || w.ap < 0)
                HXW_THROW(error::Code::Configuration, std::format("Weapon '{}' has invalid stats", w.name));
            if (w.skill < 2 || w.skill > 6)
                HXW_THROW(error::Code::Configuration,
                          std::format("Weapon '{}' skill {} outside 2..6", w.name, w.skill));
        }

        auto CheckTemplate(UnitTemplate const& t) -> void
        {
            if (t.name.empty())
                HXW_THROW(error::Code::Configuration, "Unit profile without a name");
            if (t.max_hp < 1 || t.models < 1 || t.move < 0 || t.toughness < 1)
                HXW_THROW(error::Code::Configuration, std::format("Unit profile '{}' has invalid stats", t.name));
            if (t.armor_save < 2 || t.armor_save > constants::ImpossibleSave)
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit profile '{}' armor save {} outside 2..7", t.name, t.armor_save));
            if (t.invul_save != 0 && (t.invul_save < 2 || t.invul_save > 6))
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit profile '{}' invulnerable save {} outside 2..6", t.name, t.invul_save));
        }

        auto ResolveWeapon(std::string const& name, std::string const& owner, Armory const& armory)
            -> std::optional<WeaponProfile>
        {
            if (name.empty()) return std::nullopt;
            auto const found = armory.Find(name);
            if (!found)
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit profile '{}' references unknown weapon '{}' ({})",
                                      owner, found.error().key, found.error().where));
            return **found;
        }
    }

    auto Armory::Add(WeaponProfile weapon) -> void
    {
        CheckWeapon(weapon);
        if (Find(weapon.name))
            HXW_THROW(error::Code::Configuration, std::format("Duplicate weapon '{}' in armory", weapon.name));
        weapons_.push_back(std::move(weapon));
    }

    auto Armory::Find(std::string_view const name) const -> std::expected<WeaponProfile const*, error::LookupError>
    {
        auto const it = std::ranges::find_if(weapons_, [name](WeaponProfile const& w) { return w.name == name; });
        if (it == std::cend(weapons_))
            return std::unexpected(error::LookupError{std::string{name}, "armory"});
        return &*it;
    }

    auto Scenario::FindProfile(std::string_view const name) const
        -> std::expected<UnitTemplate const*, error::LookupError>
    {
        auto const it = std::ranges::find_if(profiles, [name](UnitTemplate const& t) { return t.name == name; });
        if (it == std::cend(profiles))
            return std::unexpected(error::LookupError{std::string{name}, "unit profiles"});
        return &*it;
    }

    auto ResolveProfile(UnitTemplate const& tmpl, Armory const& armory) -> UnitProfileSP
    {
        CheckTemplate(tmpl);

        UnitProfile p{};
        p.name = tmpl.name;
        p.max_hp = tmpl.max_hp;
        p.move = tmpl.move;
        p.toughness = tmpl.toughness;
        p.armor_save = tmpl.armor_save;
        p.invul_save = tmpl.invul_save;
        p.models = tmpl.models;
        p.blocks_los = tmpl.blocks_los;
        p.ranged = ResolveWeapon(tmpl.ranged, tmpl.name, armory);
        p.melee = ResolveWeapon(tmpl.melee, tmpl.name, armory);
        return std::make_shared<UnitProfile const>(std::move(p));
    }

    auto BuildInitialState(Scenario const& scenario, Config const& config) -> GameState
    {
        if (config.max_turns < 1)
            HXW_THROW(error::Code::Configuration, "max_turns must be at least 1");
        if (config.max_steps < 1)
            HXW_THROW(error::Code::Configuration, "max_steps must be at least 1");

        GameState s{};
        s.board = std::make_shared<Board const>(scenario.cols, scenario.rows, std::span<Hex const>{scenario.walls});
        s.max_turns = config.max_turns;
        s.max_steps = config.max_steps;

        // One shared immutable profile per template.
        std::unordered_map<std::string, UnitProfileSP> resolved;
        for (UnitTemplate const& t : scenario.profiles)
        {
            if (resolved.contains(t.name))
                HXW_THROW(error::Code::Configuration, std::format("Duplicate unit profile '{}'", t.name));
            resolved.emplace(t.name, ResolveProfile(t, scenario.armory));
        }

        std::unordered_set<UnitIdT> ids;
        std::unordered_set<Hex> taken;
        std::array<int, constants::PlayerCount> per_player{};

        s.units.reserve(scenario.units.size());
        for (Placement const& p : scenario.units)
        {
            if (p.player >= constants::PlayerCount)
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit {} assigned to player {}", p.id, static_cast<int>(p.player)));
            if (!ids.insert(p.id).second)
                HXW_THROW(error::Code::Configuration, std::format("Duplicate unit id {}", p.id));
            if (!s.board->InBounds(p.pos))
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit {} placed out of bounds at ({},{})", p.id, p.pos.col, p.pos.row));
            if (s.board->IsWall(p.pos))
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit {} placed on a wall at ({},{})", p.id, p.pos.col, p.pos.row));
            if (!taken.insert(p.pos).second)
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit {} shares hex ({},{}) with another unit", p.id, p.pos.col, p.pos.row));

            auto const tmpl = scenario.FindProfile(p.profile);
            if (!tmpl)
                HXW_THROW(error::Code::Configuration,
                          std::format("Unit {} references unknown profile '{}'", p.id, tmpl.error().key));

            UnitProfileSP const& profile = resolved.at((*tmpl)->name);
            s.units.push_back(Unit{p.id, p.player, p.pos, profile->max_hp, profile});
            ++per_player[p.player];
        }

        for (PlyrIdxT i{}; i < constants::PlayerCount; ++i)
        {
            if (per_player[i] == 0)
                HXW_THROW(error::Code::Configuration, std::format("Player {} has no units", static_cast<int>(i)));
        }

        s.flags.assign(s.units.size(), UnitTurnFlags{});
        return s;
    }

    auto DefaultScenario() -> Scenario
    {
        Scenario sc{};
        sc.cols = 25;
        sc.rows = 21;
        sc.walls = {
            {10, 5}, {11, 5}, {12, 5},
            {12, 9}, {12, 10}, {12, 11},
            {12, 15}, {13, 15}, {14, 15},
        };

        sc.armory.Add({"Bolt Rifle", 10, 2, 3, 4, 1, 1});
        sc.armory.Add({"Bolt Pistol", 4, 1, 3, 4, 0, 1});
        sc.armory.Add({"Plasma Gun", 8, 1, 3, 7, 3, 2});
        sc.armory.Add({"Chainsword", 1, 3, 3, 4, 0, 1});
        sc.armory.Add({"Power Fist", 1, 2, 4, 8, 2, 2});

        sc.profiles = {
            {"Intercessors", 10, 6, 4, 3, 0, 5, false, "Bolt Rifle", "Chainsword"},
            {"Assault Squad", 5, 8, 4, 3, 0, 5, false, "Bolt Pistol", "Chainsword"},
            {"Dreadnought", 8, 5, 7, 2, 5, 1, true, "Plasma Gun", "Power Fist"},
        };

        sc.units = {
            {1, 0, "Intercessors", {2, 8}},
            {2, 0, "Dreadnought", {2, 10}},
            {3, 0, "Assault Squad", {3, 12}},
            {4, 1, "Intercessors", {22, 12}},
            {5, 1, "Dreadnought", {22, 10}},
            {6, 1, "Assault Squad", {21, 8}},
        };
        return sc;
    }
}
