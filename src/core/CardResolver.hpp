//
// CardResolver.hpp
//

#ifndef CASHFLOW_CARDRESOLVER_HPP
#define CASHFLOW_CARDRESOLVER_HPP

#include <optional>
#include <string_view>

#include "Cards.hpp"
#include "State.hpp"
#include "Types.hpp"

// Card effects. Every function edits the state it is handed (the engine's fresh copy)
// and writes its own log lines; phase changes are left to the rules.
namespace cashflow::core::resolve
{
    auto MintAssetId(GameState& s) -> AssetId;

    auto FindAsset(Player const& p, AssetId const& id) -> Asset const*;

    // Debits the player, borrowing if the debit leaves cash negative. Returns the amount borrowed.
    auto Charge(GameState& s, PlyrIdxT idx, Money amount, std::string_view reason) -> Money;

    // Returns false (and logs) when the player cannot afford it and payment was not skipped.
    auto BuyDeal(GameState& s, PlyrIdxT idx, DealCard const& card, std::int64_t shares, bool skip_payment) -> bool;

    // Price the market card offers for this asset; nullopt when the card does not apply to it.
    auto MarketSalePrice(Asset const& a, MarketEffect const& effect) -> std::optional<Money>;

    // Immediate effects are applied to every affected player.
    // Returns true when the card instead waits on players' decisions.
    auto ApplyMarket(GameState& s, MarketCard const& card) -> bool;

    // Sells one asset into an active market card. Returns the cash credited.
    auto SellToMarket(GameState& s, PlyrIdxT idx, AssetId const& id, MarketCard const& card) -> Money;

    // Sells some or all shares of a stock at a quoted price. Returns the cash credited.
    auto SellStock(GameState& s, PlyrIdxT idx, AssetId const& id, std::int64_t shares, Money price) -> Money;

    auto ApplyStockSplit(GameState& s, StockSplitDeal const& split) -> void;

    auto DoodadCost(Player const& p, DoodadCard const& card) -> Money;
    auto PayDoodad(GameState& s, PlyrIdxT idx, DoodadCard const& card) -> Money;

    // Tax, Lawsuit and Divorce on the fast track.
    auto ApplyFastTrackPenalty(GameState& s, PlyrIdxT idx, SpaceType space) -> void;
}

#endif //CASHFLOW_CARDRESOLVER_HPP
