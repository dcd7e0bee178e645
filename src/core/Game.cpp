//
// Game.cpp
//

#include "Game.hpp"

#include <format>
#include <utility>

#include "CardData.hpp"
#include "Finance.hpp"
#include "StandardRules.hpp"
#include "Util.hpp"

namespace cashflow::core
{
    namespace
    {
        template <typename T>
        auto ShuffledCopy(std::vector<std::shared_ptr<T const>> const& table, std::uint64_t& seed)
            -> std::vector<std::shared_ptr<T const>>
        {
            std::vector<std::shared_ptr<T const>> deck = table;
            util::Shuffle(deck, seed);
            return deck;
        }
    }

    GameEngine::GameEngine() :
        rules_(std::make_unique<StandardRules>())
    {
    }

    GameEngine::GameEngine(std::unique_ptr<Rules> rules) :
        rules_(std::move(rules))
    {
        CF_ASSERT(rules_ != nullptr, "engine constructed without rules");
    }

    auto GameEngine::CreateGame(std::span<PlayerSeat const> roster,
                                std::span<ProfessionSP const> professions,
                                Config const& config) const -> GameState
    {
        if (roster.empty()) CF_THROW(error::Code::State, "cannot start a game with no players");
        if (professions.empty()) CF_THROW(error::Code::State, "cannot start a game with no professions");
        CF_ASSERT(config.starting_position < constants::RatRaceSize, "starting position off the board");

        GameState s;
        s.shuffle_seed = config.seed;
        s.fast_track_win_cash_flow = config.fast_track_win_cash_flow;

        std::vector<ProfessionSP> dealt(professions.begin(), professions.end());
        util::Shuffle(dealt, s.shuffle_seed);

        s.players.reserve(roster.size());
        for (std::size_t i = 0; i < roster.size(); ++i)
        {
            ProfessionSP const& prof = dealt[i % dealt.size()];
            CF_ASSERT(prof != nullptr, "null profession card");
            Player p = finance::NewPlayer(roster[i], *prof);
            p.position = config.starting_position;
            s.players.push_back(std::move(p));
        }

        s.decks.small_deals = ShuffledCopy(data::SmallDeals(), s.shuffle_seed);
        s.decks.big_deals = ShuffledCopy(data::BigDeals(), s.shuffle_seed);
        s.decks.market = ShuffledCopy(data::MarketCards(), s.shuffle_seed);
        s.decks.doodads = ShuffledCopy(data::Doodads(), s.shuffle_seed);

        AddLog(s, s.Current().id, std::format("Game started with {} player(s).", s.players.size()));
        for (Player const& p : s.players)
        {
            AddLog(s, p.id, std::format("{} is a {} with ${} cash and ${}/mo cash flow.",
                                        p.name, p.profession, p.cash, finance::CashFlow(p)));
        }
        return s;
    }

    auto GameEngine::ProcessAction(GameState const& state, GameAction const& action) const -> GameState
    {
        if (auto const ok = rules_->Validate(state, action); !ok.has_value())
        {
            GameState rejected = state;
            AddLog(rejected, ActorOf(action), std::format("{}{}", InvalidActionPrefix, error::describe(ok.error())));
            return rejected;
        }

        GameState next = rules_->Apply(state, action);
        rules_->Advance(next);
        return next;
    }

    auto GameEngine::GetValidActions(GameState const& state) const -> std::vector<ActionType>
    {
        return rules_->ValidActions(state);
    }

    auto IsInvalidResult(GameState const& before, GameState const& after) -> bool
    {
        return after.log.size() > before.log.size() && after.log.back().message.starts_with(InvalidActionPrefix);
    }

    namespace
    {
        auto DefaultEngine() -> GameEngine const&
        {
            static GameEngine const engine{};
            return engine;
        }
    }

    auto CreateGame(std::span<PlayerSeat const> roster,
                    std::span<ProfessionSP const> professions,
                    Config const& config) -> GameState
    {
        return DefaultEngine().CreateGame(roster, professions, config);
    }

    auto ProcessAction(GameState const& state, GameAction const& action) -> GameState
    {
        return DefaultEngine().ProcessAction(state, action);
    }

    auto GetValidActions(GameState const& state) -> std::vector<ActionType>
    {
        return DefaultEngine().GetValidActions(state);
    }
}
