//
// Player.hpp
//

#ifndef HEXWAR_PLAYER_HPP
#define HEXWAR_PLAYER_HPP

#include <memory>
#include "Actions.hpp"
#include "State.hpp"

namespace hexwar::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by a driving loop (self-play, tests) with the acting seat's snapshot;
        // snapshot->legal lists every request the engine would accept.
        virtual auto Play(std::shared_ptr<GameSnapshot const> snapshot) -> ActionRequest = 0;
    };
}
#endif //HEXWAR_PLAYER_HPP
