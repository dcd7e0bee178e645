//
// AuditLogger.hpp
//

#ifndef CASHFLOW_AUDITLOGGER_HPP
#define CASHFLOW_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace cashflow::core::debug
{
    // Plain-text game transcript, one line per action.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Header (seed, seats and professions)
        auto start(GameState const& s, std::uint64_t seed) -> void;

        // Before the engine sees the action
        auto action(GameState const& s, GameAction const& a) -> void;

        // After the engine: Applied or Invalid, plus the new log lines
        auto outcome(GameState const& before, GameState const& after) -> void;

        // Footer (winner, turns, final cash flows)
        auto end(GameState const& s) -> void;

        auto flush() -> void;

    private:
        std::ofstream out_;
    };

    // Short human form of an action, e.g. "TAKE_LOAN(p1, $3000)".
    auto Describe(GameAction const& a) -> std::string;
}

#endif //CASHFLOW_AUDITLOGGER_HPP
