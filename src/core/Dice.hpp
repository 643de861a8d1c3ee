//
// Dice.hpp
//

#ifndef HEXWAR_DICE_HPP
#define HEXWAR_DICE_HPP

#include <cstdint>
#include <random>

namespace hexwar::core
{
    // Seeded D6 source. std::uniform_int_distribution is implementation-defined,
    // so faces come from plain rejection sampling on the raw engine output and a
    // given seed produces the same sequence on every standard library.
    class Dice
    {
    public:
        explicit Dice(std::uint64_t const seed) : rng_{seed}, seed_{seed} {}

        auto D6() -> int
        {
            // Largest multiple of 6 representable by mt19937_64 output.
            constexpr std::uint64_t Limit = std::mt19937_64::max() - (std::mt19937_64::max() % 6);
            std::uint64_t v = rng_();
            while (v >= Limit) v = rng_();
            ++rolled_;
            return static_cast<int>(v % 6) + 1;
        }

        auto Sum(int const n) -> int
        {
            int total{};
            for (int i = 0; i < n; ++i) total += D6();
            return total;
        }

        auto Seed() const noexcept -> std::uint64_t { return seed_; }
        auto Rolled() const noexcept -> std::uint64_t { return rolled_; }

    private:
        std::mt19937_64 rng_;
        std::uint64_t seed_;
        std::uint64_t rolled_{0};
    };
}

#endif //HEXWAR_DICE_HPP
