//
// CardData.hpp
//

#ifndef CASHFLOW_CARDDATA_HPP
#define CASHFLOW_CARDDATA_HPP

#include <vector>

#include "Cards.hpp"

// Immutable reference tables. Built once, shared by every game.
namespace cashflow::core::data
{
    auto Professions() -> std::vector<ProfessionSP> const&;
    auto SmallDeals() -> std::vector<DealSP> const&;
    auto BigDeals() -> std::vector<DealSP> const&;
    auto MarketCards() -> std::vector<MarketSP> const&;
    auto Doodads() -> std::vector<DoodadSP> const&;

    // Lookup by profession title; nullptr when unknown.
    auto FindProfession(std::string_view title) -> ProfessionSP;

    // Lookup by card id across both deal decks / the market deck / the doodad deck.
    auto FindDeal(std::string_view id) -> DealSP;
    auto FindMarket(std::string_view id) -> MarketSP;
    auto FindDoodad(std::string_view id) -> DoodadSP;
}

#endif //CASHFLOW_CARDDATA_HPP
