//
// State.cpp
//

#include "State.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include "HexGeometry.hpp"

namespace hexwar::core
{
    auto GameState::FindSlot(UnitIdT const id) const -> std::optional<std::size_t>
    {
        auto const it = std::ranges::find_if(units, [id](Unit const& u) { return u.id == id; });
        if (it == std::cend(units)) return std::nullopt;
        return static_cast<std::size_t>(std::distance(std::cbegin(units), it));
    }

    auto GameState::Find(UnitIdT const id) const -> Unit const*
    {
        auto const slot = FindSlot(id);
        return slot ? &units[*slot] : nullptr;
    }

    auto GameState::UnitAt(Hex const h) const -> Unit const*
    {
        auto const it = std::ranges::find_if(units, [h](Unit const& u) { return u.Alive() && u.pos == h; });
        return (it != std::cend(units)) ? &*it : nullptr;
    }

    auto GameState::LiveCount(PlyrIdxT const player) const -> int
    {
        return static_cast<int>(std::ranges::count_if(units, [player](Unit const& u)
        {
            return u.player == player && u.Alive();
        }));
    }

    auto GameState::InPool(std::size_t const slot) const -> bool
    {
        return std::ranges::find(pool, slot) != std::cend(pool);
    }

    auto GameState::Engaged(Unit const& u) const -> bool
    {
        return std::ranges::any_of(units, [&u](Unit const& other)
        {
            return other.Alive() && other.player != u.player && hex::Adjacent(other.pos, u.pos);
        });
    }
}
