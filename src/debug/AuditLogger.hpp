//
// Created by Malik T on 10/10/2025.
//

#ifndef MATHHIGHLOW_AUDITLOGGER_HPP
#define MATHHIGHLOW_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/Scoring.hpp"
#include "../core/Types.hpp"

namespace mhl::core::debug
{
    // Plain-text round transcript for replaying a seeded session.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]] auto IsOpen() const -> bool { return out_.is_open(); }

        // Session header (seed, credits, targets)
        auto start(GameImpl const& game, std::uint64_t seed) -> void;

        // After PlayRound: both hands, expressions, values and settlement
        auto round(GameImpl const& game, RoundResult const& r) -> void;

        // Game end footer (Winner=Player|AI|None)
        auto end(GameImpl const& game) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //MATHHIGHLOW_AUDITLOGGER_HPP
