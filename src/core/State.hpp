//
// State.hpp
//

#ifndef CASHFLOW_STATE_HPP
#define CASHFLOW_STATE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Types.hpp"
#include "Cards.hpp"

namespace cashflow::core
{
    // ---- balance sheet ----

    struct StockAsset
    {
        AssetId id;
        std::string name;
        std::string symbol;
        std::int64_t shares{};
        double cost_per_share{};
        double dividend_per_share{};
    };

    struct RealEstateAsset
    {
        AssetId id;
        std::string name;
        RealEstateType sub_type{RealEstateType::House};
        Money cost{};
        Money mortgage{};
        Money down_payment{};
        Money cash_flow{};
    };

    struct BusinessAsset
    {
        AssetId id;
        std::string name;
        Money cost{};
        Money mortgage{};
        Money down_payment{};
        Money cash_flow{};
    };

    using Asset = std::variant<StockAsset, RealEstateAsset, BusinessAsset>;

    inline auto IdOf(Asset const& a) -> AssetId const&
    {
        return std::visit([](auto const& x) -> AssetId const& { return x.id; }, a);
    }

    struct Liability
    {
        std::string name;
        Money balance{};
        Money payment{};
    };

    struct Expenses
    {
        Money taxes{};
        Money home_mortgage_payment{};
        Money school_loan_payment{};
        Money car_loan_payment{};
        Money credit_card_payment{};
        Money other_expenses{};
        Money per_child_expense{};
        int child_count{};
    };

    struct FinancialStatement
    {
        Money salary{};
        Expenses expenses{};
        std::vector<Asset> assets;
        std::vector<Liability> liabilities;
    };

    struct Player
    {
        PlayerId id;
        std::string name;
        std::string profession;
        FinancialStatement statement;
        Money cash{};

        std::size_t position{};
        bool in_fast_track{false};
        std::size_t fast_track_position{};
        Money fast_track_cash_flow{};

        bool has_escaped{false};
        bool has_won{false};
        std::optional<std::string> dream{};

        int downsized_turns_left{};
        int charity_turns_left{};
        Money bank_loan_amount{};
        bool is_bankrupt{false};
        int bankrupt_turns_left{};
    };

    // ---- cards in play ----

    struct ActiveSmallDeal { DealSP card; };
    struct ActiveBigDeal   { DealSP card; };
    struct ActiveMarket    { MarketSP card; };
    struct ActiveDoodad    { DoodadSP card; };

    using ActiveCard = std::variant<std::monostate, ActiveSmallDeal, ActiveBigDeal, ActiveMarket, ActiveDoodad>;

    // Mirrors ActiveCard's alternative order.
    enum class ActiveCardKind : std::uint8_t
    {
        None,
        SmallDeal,
        BigDeal,
        Market,
        Doodad
    };

    inline auto KindOf(ActiveCard const& c) -> ActiveCardKind
    {
        return static_cast<ActiveCardKind>(c.index());
    }

    // Deal card behind an active small/big deal, nullptr otherwise.
    inline auto ActiveDealCard(ActiveCard const& c) -> DealSP
    {
        if (auto const* s = std::get_if<ActiveSmallDeal>(&c)) return s->card;
        if (auto const* b = std::get_if<ActiveBigDeal>(&c)) return b->card;
        return nullptr;
    }

    // Draw piles are consumed from the front. A null entry is a face-down placeholder.
    struct Decks
    {
        std::vector<DealSP> small_deals;
        std::vector<DealSP> big_deals;
        std::vector<MarketSP> market;
        std::vector<DoodadSP> doodads;

        std::vector<DealSP> small_deal_discard;
        std::vector<DealSP> big_deal_discard;
        std::vector<MarketSP> market_discard;
        std::vector<DoodadSP> doodad_discard;
    };

    struct LogEntry
    {
        std::uint32_t turn{};
        PlayerId player_id;
        std::string message;
    };

    struct PendingPlayerDeal
    {
        PlayerId seller_id;
        PlayerId buyer_id;
        DealSP card;
        Money asking_price{};
    };

    struct GameState
    {
        std::vector<Player> players;
        PlyrIdxT current_player_index{};
        TurnPhase turn_phase{TurnPhase::RollDice};
        ActiveCard active_card{};
        std::optional<Dice> dice_result{};
        Decks decks{};
        std::vector<LogEntry> log;
        std::uint32_t turn_number{1};
        std::optional<PlayerId> winner{};
        std::optional<PendingPlayerDeal> pending_player_deal{};
        std::uint64_t next_asset_id{1};
        int pay_days_remaining{};
        // state of the reshuffle generator; hidden from clients
        std::uint64_t shuffle_seed{};
        Money fast_track_win_cash_flow{50'000};

        [[nodiscard]]
        auto Current() const -> Player const& { return players[current_player_index]; }

        [[nodiscard]]
        auto Current() -> Player& { return players[current_player_index]; }

        [[nodiscard]]
        auto FindPlayer(PlayerId const& id) const -> std::optional<PlyrIdxT>
        {
            for (PlyrIdxT i = 0; i < players.size(); ++i)
            {
                if (players[i].id == id) return i;
            }
            return std::nullopt;
        }
    };

    struct PlayerSeat
    {
        PlayerId id;
        std::string name;
    };

    inline auto AddLog(GameState& s, PlayerId const& who, std::string msg) -> void
    {
        s.log.push_back(LogEntry{.turn = s.turn_number, .player_id = who, .message = std::move(msg)});
    }
}

#endif //CASHFLOW_STATE_HPP
