//
// Invariants.hpp
//

#ifndef CASHFLOW_INVARIANTS_HPP
#define CASHFLOW_INVARIANTS_HPP

#include <algorithm>
#include <charconv>
#include <format>
#include <unordered_set>
#include <vector>

#include "../core/CardData.hpp"
#include "../core/Exception.hpp"
#include "../core/State.hpp"

namespace cashflow::core::debug
{
    namespace detail
    {
        template <typename A>
        auto FaceUp(GameState const& s) -> decltype(A::card)
        {
            if (auto const* c = std::get_if<A>(&s.active_card)) return c->card;
            return nullptr;
        }

        template <typename T>
        auto CountPile(std::vector<std::shared_ptr<T const>> const& pile,
                       std::unordered_set<void const*>& seen,
                       std::string_view name) -> std::size_t
        {
            std::size_t n = 0;
            for (auto const& c : pile)
            {
                ++n;
                if (!c) continue; // placeholder in a sanitized view
                if (!seen.insert(c.get()).second)
                {
                    CF_THROW(error::Code::State, std::format("card {} appears twice ({})", c->id, name));
                }
            }
            return n;
        }

        template <typename T>
        auto CheckDeck(std::vector<std::shared_ptr<T const>> const& deck,
                       std::vector<std::shared_ptr<T const>> const& discard,
                       std::shared_ptr<T const> const& face_up,
                       std::size_t reference,
                       std::string_view name) -> void
        {
            std::unordered_set<void const*> seen;
            std::size_t total = CountPile(deck, seen, name) + CountPile(discard, seen, name);
            if (face_up)
            {
                ++total;
                if (!seen.insert(face_up.get()).second)
                {
                    CF_THROW(error::Code::State, std::format("face-up card {} is also in the {} piles", face_up->id, name));
                }
            }
            if (total > reference)
            {
                CF_THROW(error::Code::State, std::format("{} deck holds {} cards, only {} exist", name, total, reference));
            }
        }
    }

    // Cross-checks the state after every step in tests and self-play. Throws StateError on the first
    // broken rule; a passing state returns silently.
    inline auto CheckInvariants(GameState const& s) -> void
    {
#if CF_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        using error::Code;

        if (s.players.empty()) CF_THROW(Code::State, "game without players");
        if (s.current_player_index >= s.players.size())
        {
            CF_THROW(Code::State, std::format("current player index {} out of range", s.current_player_index));
        }

        // 1) asset ids unique and already minted
        std::unordered_set<AssetId> ids;
        for (Player const& p : s.players)
        {
            for (Asset const& a : p.statement.assets)
            {
                AssetId const& id = IdOf(a);
                if (!ids.insert(id).second) CF_THROW(Code::State, std::format("asset id {} is held twice", id));

                constexpr std::string_view prefix = "asset-";
                std::uint64_t n{};
                auto const [ptr, ec] = std::from_chars(id.data() + std::min(id.size(), prefix.size()),
                                                       id.data() + id.size(), n);
                if (!id.starts_with(prefix) || ec != std::errc{} || ptr != id.data() + id.size() ||
                    n == 0 || n >= s.next_asset_id)
                {
                    CF_THROW(Code::State, std::format("asset id {} was never minted (next is {})", id, s.next_asset_id));
                }
            }
            if (p.statement.expenses.child_count < 0 || p.statement.expenses.child_count > constants::MaxChildren)
            {
                CF_THROW(Code::State, std::format("{} has {} children", p.id, p.statement.expenses.child_count));
            }
            if (p.bank_loan_amount < 0 || p.bank_loan_amount % constants::LoanIncrement != 0)
            {
                CF_THROW(Code::State, std::format("{} owes the bank ${}", p.id, p.bank_loan_amount));
            }
        }

        // 2) pay days only pending while they are being collected
        if (s.pay_days_remaining != 0 && s.turn_phase != TurnPhase::PayDayCollection)
        {
            CF_THROW(Code::State, std::format("{} pay day(s) left over in {}", s.pay_days_remaining, to_string(s.turn_phase)));
        }

        // 3) a pending offer exists exactly while its buyer is being asked
        bool const waiting = s.turn_phase == TurnPhase::WaitingForDealResponse;
        if (waiting != s.pending_player_deal.has_value())
        {
            CF_THROW(Code::State, "pending deal and WAITING_FOR_DEAL_RESPONSE disagree");
        }

        // 4) winner and phase agree
        if (s.winner && s.turn_phase != TurnPhase::GameOver)
        {
            CF_THROW(Code::State, "winner named before the game is over");
        }

        // 5) cards are conserved
        detail::CheckDeck(s.decks.small_deals, s.decks.small_deal_discard, detail::FaceUp<ActiveSmallDeal>(s),
                          data::SmallDeals().size(), "small deal");
        detail::CheckDeck(s.decks.big_deals, s.decks.big_deal_discard, detail::FaceUp<ActiveBigDeal>(s),
                          data::BigDeals().size(), "big deal");
        detail::CheckDeck(s.decks.market, s.decks.market_discard, detail::FaceUp<ActiveMarket>(s),
                          data::MarketCards().size(), "market");
        detail::CheckDeck(s.decks.doodads, s.decks.doodad_discard, detail::FaceUp<ActiveDoodad>(s),
                          data::Doodads().size(), "doodad");
#endif
    }

    // Total cards across every pile plus the face-up card, for conservation checks in tests.
    inline auto CardsInPlay(GameState const& s) -> std::size_t
    {
        std::size_t const face_up = KindOf(s.active_card) == ActiveCardKind::None ? 0 : 1;
        return s.decks.small_deals.size() + s.decks.small_deal_discard.size() +
               s.decks.big_deals.size() + s.decks.big_deal_discard.size() +
               s.decks.market.size() + s.decks.market_discard.size() +
               s.decks.doodads.size() + s.decks.doodad_discard.size() + face_up;
    }
}

#endif //CASHFLOW_INVARIANTS_HPP
