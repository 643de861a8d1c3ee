//
// State.hpp
//

#ifndef HEXWAR_STATE_HPP
#define HEXWAR_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"
#include "Board.hpp"

namespace hexwar::core
{
    // The mutable world of one episode. Owned by exactly one GameImpl.
    struct GameState
    {
        BoardCSP board;
        std::vector<Unit> units;             // scenario order, dead units stay in place
        std::vector<UnitTurnFlags> flags;    // parallel to units
        std::vector<std::size_t> pool;       // unit slots still allowed to act this phase

        std::uint16_t turn{1};
        Phase phase{Phase::Move};
        PlyrIdxT current_player{0};         // owner of the turn
        PlyrIdxT acting_player{0};          // seat whose request is expected next
        PlyrIdxT fight_initiative{0};       // seat due to strike next once chargers are done
        std::uint32_t steps{0};

        std::uint16_t max_turns{};
        std::uint32_t max_steps{};

        bool over{false};
        bool truncated{false};
        std::optional<PlyrIdxT> winner{};   // nullopt with over == true is a draw

        auto FindSlot(UnitIdT id) const -> std::optional<std::size_t>;
        auto Find(UnitIdT id) const -> Unit const*;
        // Live unit standing on h, if any.
        auto UnitAt(Hex h) const -> Unit const*;
        auto LiveCount(PlyrIdxT player) const -> int;
        auto InPool(std::size_t slot) const -> bool;
        // Adjacent to at least one live enemy.
        auto Engaged(Unit const& u) const -> bool;
    };

    // Immutable copy handed to policies; legal is filled only for the acting seat.
    struct GameSnapshot
    {
        PlyrIdxT seat{};
        PlyrIdxT current_player{};
        PlyrIdxT acting_player{};
        Phase phase{Phase::Move};
        std::uint16_t turn{};
        int board_cols{};
        int board_rows{};
        std::vector<Unit> units;
        std::vector<ActionRequest> legal;
    };
} // namespace hexwar::core

#endif //HEXWAR_STATE_HPP
