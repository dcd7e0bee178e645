//
// Game.hpp
//

#ifndef CASHFLOW_GAME_HPP
#define CASHFLOW_GAME_HPP

#include <memory>
#include <span>
#include <vector>

#include "Actions.hpp"
#include "Cards.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace cashflow::core
{
    inline constexpr std::string_view InvalidActionPrefix = "Invalid action: ";

    // Pure reducer around a rule set. Holds no game state of its own, so one engine
    // can serve any number of games.
    class GameEngine
    {
    public:
        GameEngine();
        explicit GameEngine(std::unique_ptr<Rules> rules);

        // Professions are shuffled from the seed and handed out in seat order, cycling when
        // there are fewer professions than players.
        auto CreateGame(std::span<PlayerSeat const> roster,
                        std::span<ProfessionSP const> professions,
                        Config const& config = {}) const -> GameState;

        // A rejected action comes back as the same state plus one "Invalid action: ..." log entry.
        auto ProcessAction(GameState const& state, GameAction const& action) const -> GameState;

        auto GetValidActions(GameState const& state) const -> std::vector<ActionType>;

        auto RulesRef() const noexcept -> Rules const& { return *rules_; }

    private:
        std::unique_ptr<Rules> rules_;
    };

    // True when `after` gained exactly the rejection entry ProcessAction appends.
    [[nodiscard]]
    auto IsInvalidResult(GameState const& before, GameState const& after) -> bool;

    // Convenience entry points backed by a shared StandardRules engine.
    auto CreateGame(std::span<PlayerSeat const> roster,
                    std::span<ProfessionSP const> professions,
                    Config const& config = {}) -> GameState;
    auto ProcessAction(GameState const& state, GameAction const& action) -> GameState;
    auto GetValidActions(GameState const& state) -> std::vector<ActionType>;
}

#endif //CASHFLOW_GAME_HPP
