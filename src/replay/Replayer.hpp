//
// Replayer.hpp
//

#ifndef HEXWAR_REPLAYER_HPP
#define HEXWAR_REPLAYER_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include "codec.hpp"

namespace hexwar::core::replay
{
    // First record whose re-derived verdict differs from the logged one.
    struct Divergence
    {
        std::size_t index{};       // position in the record list
        std::uint32_t step{};
        std::string field;
        std::string logged;
        std::string replayed;
    };

    struct ReplaySummary
    {
        std::size_t records{};
        std::size_t rejected{};
        std::optional<PlyrIdxT> winner{};
        bool terminal{false};
        bool truncated{false};
    };

    // Rebuilds the episode from scenario + seed + limits and feeds every logged
    // request back through the engine. Invariant failures propagate as exceptions.
    auto VerifyReplay(ReplayLog const& log) -> std::expected<ReplaySummary, Divergence>;

    auto describe(Divergence const& d) -> std::string;
}

#endif //HEXWAR_REPLAYER_HPP
