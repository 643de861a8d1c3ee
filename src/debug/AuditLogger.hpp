//
// AuditLogger.hpp
//

#ifndef HEXWAR_AUDITLOGGER_HPP
#define HEXWAR_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace hexwar::core::debug
{
    // Plain-text transcript of one episode, one line per submitted request.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, board, limits, roster)
        auto start(GameImpl const& game) -> void;

        // Request, verdict and effects of one step
        auto record(ActionRecord const& rec) -> void;

        // Footer (winner or draw, truncation, step count)
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    auto FormatRequest(ActionRequest const& a) -> std::string;
    auto FormatRecord(ActionRecord const& rec) -> std::string;
}

#endif //HEXWAR_AUDITLOGGER_HPP
