//
// GameSession.cpp
//

#include "GameSession.hpp"

#include <utility>

#include "../core/Util.hpp"

namespace cashflow::session
{
    GameSession::GameSession(std::string room,
                             std::span<core::PlayerSeat const> roster,
                             std::span<core::ProfessionSP const> professions,
                             core::Config const& config) :
        room_(std::move(room)),
        engine_(),
        state_(engine_.CreateGame(roster, professions, config)),
        // dice must not replay the deck shuffle
        dice_rng_(config.seed ^ 0x9E3779B97F4A7C15ull)
    {
    }

    auto GameSession::RollDice() -> core::Dice
    {
        std::uniform_int_distribution<int> die{1, 6};
        int const first = die(dice_rng_);
        int const second = die(dice_rng_);
        return {first, second};
    }

    auto GameSession::ProcessAction(GameAction action) -> ActionResult
    {
        if (auto* roll = std::get_if<core::RollDiceAction>(&action))
        {
            roll->dice_values = RollDice();
        }

        GameState next = engine_.ProcessAction(state_, action);
        bool const rejected = core::IsInvalidResult(state_, next);
        state_ = std::move(next);

        ActionResult out = Snapshot();
        if (rejected)
        {
            out.success = false;
            out.error = state_.log.back().message.substr(core::InvalidActionPrefix.size());
        }
        return out;
    }

    auto GameSession::GetSanitizedState() const -> GameState
    {
        GameState s = state_;
        core::Decks& d = s.decks;
        d.small_deals = core::util::Placeholders(d.small_deals);
        d.big_deals = core::util::Placeholders(d.big_deals);
        d.market = core::util::Placeholders(d.market);
        d.doodads = core::util::Placeholders(d.doodads);
        d.small_deal_discard = core::util::Placeholders(d.small_deal_discard);
        d.big_deal_discard = core::util::Placeholders(d.big_deal_discard);
        d.market_discard = core::util::Placeholders(d.market_discard);
        d.doodad_discard = core::util::Placeholders(d.doodad_discard);
        s.shuffle_seed = 0;
        return s;
    }

    auto GameSession::GetValidActions() const -> std::vector<core::ActionType>
    {
        return engine_.GetValidActions(state_);
    }

    auto GameSession::Snapshot() const -> ActionResult
    {
        return ActionResult{
            .success = true,
            .state = GetSanitizedState(),
            .error = std::nullopt,
            .valid_actions = GetValidActions()};
    }
}
