//
// GameSession.hpp
//

#ifndef CASHFLOW_GAMESESSION_HPP
#define CASHFLOW_GAMESESSION_HPP

#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "../core/Actions.hpp"
#include "../core/Game.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace cashflow::session
{
    using core::GameAction;
    using core::GameState;

    struct ActionResult
    {
        bool success{false};
        GameState state{};                            // always sanitized
        std::optional<std::string> error{};
        std::vector<core::ActionType> valid_actions{};
    };

    // One room's authoritative game. Not synchronised: SessionManager runs at most one
    // call at a time per session.
    class GameSession
    {
    public:
        GameSession(std::string room,
                    std::span<core::PlayerSeat const> roster,
                    std::span<core::ProfessionSP const> professions,
                    core::Config const& config = {});

        // ROLL_DICE payloads are replaced with server dice before the engine sees them.
        auto ProcessAction(GameAction action) -> ActionResult;

        // Same state with every draw and discard pile reduced to placeholders of equal length
        // and the shuffle seed cleared. Only pile sizes leave the server.
        auto GetSanitizedState() const -> GameState;

        auto GetValidActions() const -> std::vector<core::ActionType>;

        auto RollDice() -> core::Dice;

        // Current result without acting, for late joiners and broadcasts.
        auto Snapshot() const -> ActionResult;

        auto Room() const noexcept -> std::string const& { return room_; }
        auto IsOver() const noexcept -> bool { return state_.turn_phase == core::TurnPhase::GameOver; }

        // Unsanitized; tests and audit only.
        auto AuthoritativeState() const noexcept -> GameState const& { return state_; }

    private:
        std::string room_;
        core::GameEngine engine_;
        GameState state_;
        std::mt19937_64 dice_rng_;
    };
}

#endif //CASHFLOW_GAMESESSION_HPP
