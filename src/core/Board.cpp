//
// Board.cpp
//

#include "Board.hpp"

#include <algorithm>

#include "Exception.hpp"

namespace cashflow::core::board
{
    namespace
    {
        using enum SpaceType;

        constexpr std::array<Space, constants::RatRaceSize> kRatRace{{
            {Deal}, {Doodad}, {Market}, {Deal}, {PayDay}, {Deal},
            {Baby}, {Deal}, {Market}, {Deal}, {PayDay}, {Doodad},
            {Deal}, {Charity}, {Deal}, {Market}, {PayDay}, {Deal},
            {Downsized}, {Deal}, {Doodad}, {Deal}, {PayDay}, {Market},
        }};

        constexpr std::array<Space, constants::FastTrackSize> kFastTrack{{
            {CashFlowDay},
            {Dream, "World Travel"},
            {BusinessDeal},
            {Charity},
            {CashFlowDay},
            {Dream, "Private Jet"},
            {Tax},
            {BusinessDeal},
            {CashFlowDay},
            {Dream, "Amazon Rainforest Adventure"},
            {Lawsuit},
            {BusinessDeal},
            {CashFlowDay},
            {Dream, "African Safari"},
            {Divorce},
            {BusinessDeal},
            {CashFlowDay},
            {Dream, "Education Foundation"},
        }};

        constexpr std::array<std::size_t, 4> kPayDays{4, 10, 16, 22};
        constexpr std::array<std::size_t, 5> kCashFlowDays{0, 4, 8, 12, 16};

        static_assert(std::ranges::all_of(kPayDays, [](std::size_t p) { return kRatRace[p].type == PayDay; }));
        static_assert(std::ranges::all_of(kCashFlowDays, [](std::size_t p) { return kFastTrack[p].type == CashFlowDay; }));
    }

    auto RatRace() -> std::span<Space const> { return kRatRace; }
    auto FastTrack() -> std::span<Space const> { return kFastTrack; }

    auto RatRaceSpace(std::size_t pos) -> SpaceType
    {
        CF_ASSERT(pos < kRatRace.size(), "rat race position out of range");
        return kRatRace[pos].type;
    }

    auto FastTrackSpace(std::size_t pos) -> Space const&
    {
        CF_ASSERT(pos < kFastTrack.size(), "fast track position out of range");
        return kFastTrack[pos];
    }

    auto PayDayPositions() -> std::span<std::size_t const> { return kPayDays; }
    auto CashFlowDayPositions() -> std::span<std::size_t const> { return kCashFlowDays; }

    auto DreamPosition(std::string_view dream) -> std::optional<std::size_t>
    {
        for (std::size_t i = 0; i < kFastTrack.size(); ++i)
        {
            if (kFastTrack[i].type == SpaceType::Dream && kFastTrack[i].label == dream) return i;
        }
        return std::nullopt;
    }

    auto CountCrossings(std::size_t old_pos, std::size_t new_pos, std::span<std::size_t const> markers) -> int
    {
        if (new_pos > old_pos)
        {
            return static_cast<int>(std::ranges::count_if(markers, [&](std::size_t m)
            {
                return m > old_pos && m <= new_pos;
            }));
        }
        // wrapped, or came all the way round
        return static_cast<int>(std::ranges::count_if(markers, [&](std::size_t m)
        {
            return m > old_pos || m <= new_pos;
        }));
    }

    auto DiceTotal(Dice const& dice, bool use_both, bool charity_active, bool fast_track) -> int
    {
        if (fast_track || (use_both && charity_active))
        {
            return dice[0] + dice[1];
        }
        return dice[0];
    }
}
