//
// Board.hpp
//

#ifndef CASHFLOW_BOARD_HPP
#define CASHFLOW_BOARD_HPP

#include <array>
#include <optional>
#include <span>
#include <string_view>

#include "Types.hpp"

namespace cashflow::core::board
{
    struct Space
    {
        SpaceType type;
        std::string_view label{};
    };

    auto RatRace() -> std::span<Space const>;
    auto FastTrack() -> std::span<Space const>;

    auto RatRaceSpace(std::size_t pos) -> SpaceType;
    auto FastTrackSpace(std::size_t pos) -> Space const&;

    // Positions of PayDay on the rat race / CashFlowDay on the fast track, ascending.
    auto PayDayPositions() -> std::span<std::size_t const>;
    auto CashFlowDayPositions() -> std::span<std::size_t const>;

    // Fast-track position of a dream, if the name is one.
    auto DreamPosition(std::string_view dream) -> std::optional<std::size_t>;

    [[nodiscard]]
    constexpr auto Move(std::size_t pos, int roll, std::size_t track_size) -> std::size_t
    {
        return (pos + static_cast<std::size_t>(roll)) % track_size;
    }

    // Markers strictly after old_pos and at-or-before new_pos, wrapping at most once.
    // old_pos == new_pos is a full lap and counts every marker.
    [[nodiscard]]
    auto CountCrossings(std::size_t old_pos, std::size_t new_pos, std::span<std::size_t const> markers) -> int;

    // Rat race: first die unless a charity entitlement is active and both dice were requested.
    // Fast track: always both dice.
    [[nodiscard]]
    auto DiceTotal(Dice const& dice, bool use_both, bool charity_active, bool fast_track) -> int;
}

#endif //CASHFLOW_BOARD_HPP
