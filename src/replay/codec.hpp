//
// codec.hpp
//

#ifndef HEXWAR_CODEC_HPP
#define HEXWAR_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/Scenario.hpp"
#include "../core/Game.hpp"
#include "../core/Exception.hpp"

#include "generated/flatbuffers/hexwar_log_generated.h"

namespace hexwar::core::replay
{
    inline constexpr std::uint16_t SchemaVersion = 1;

    struct ParseError
    {
        std::string message;
    };

    // Decoded form of a replay buffer. Violations carry only their code.
    struct ReplayLog
    {
        std::uint16_t schema_version{};
        std::uint64_t seed{};
        std::uint16_t max_turns{};
        std::uint32_t max_steps{};
        RewardConfig rewards{};
        Scenario scenario{};
        std::vector<ActionRecord> records;
        std::optional<PlyrIdxT> winner{};
        bool truncated{false};
    };

    auto ToFbPhase(Phase p) noexcept -> gen::log::Phase;
    auto FromFbPhase(gen::log::Phase p) noexcept -> Phase;
    auto ToFbKind(ActionKind k) noexcept -> gen::log::ActionKind;
    auto FromFbKind(gen::log::ActionKind k) noexcept -> ActionKind;
    auto ToFbOutcome(StepOutcome o) noexcept -> gen::log::StepOutcome;
    auto FromFbOutcome(gen::log::StepOutcome o) noexcept -> StepOutcome;

    // Scenario, seed, limits, reward weights and the full history of the game.
    // Throws SerializationError when the game keeps no history.
    auto BuildReplay(GameImpl const& g) -> flatbuffers::DetachedBuffer;

    // Lower level form used by BuildReplay and by tests that craft logs.
    auto BuildReplay(ReplayLog const& log) -> flatbuffers::DetachedBuffer;

    // Verifies the buffer before touching it; never throws on bad input.
    auto DecodeReplay(std::span<std::byte const> bytes) -> std::expected<ReplayLog, ParseError>;

    auto WriteReplayFile(std::filesystem::path const& path, flatbuffers::DetachedBuffer const& buf) -> void;
    auto ReadReplayFile(std::filesystem::path const& path) -> std::expected<std::vector<std::byte>, ParseError>;
} // namespace hexwar::core::replay

#endif //HEXWAR_CODEC_HPP
