//
// RandomAi.hpp
//

#ifndef HEXWAR_RANDOMAI_HPP
#define HEXWAR_RANDOMAI_HPP

#include <random>
#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace hexwar::core
{
    // Uniform pick among the legal requests, with a separate pass weight so units
    // do not idle through whole phases.
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(std::uint64_t seed, double pass_chance = 0.1);

        auto Play(std::shared_ptr<GameSnapshot const> snapshot) -> ActionRequest override;

    private:
        std::mt19937_64 rng_;
        double pass_chance_;
    };
}

#endif //HEXWAR_RANDOMAI_HPP
