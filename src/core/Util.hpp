//
// Util.hpp
//

#ifndef CASHFLOW_UTIL_HPP
#define CASHFLOW_UTIL_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

namespace cashflow::core::util
{
    // Shuffles with a generator seeded from `seed`, then moves `seed` on so the
    // next shuffle differs. Same seed in, same order out.
    template <typename T>
    auto Shuffle(std::vector<T>& v, std::uint64_t& seed) -> void
    {
        std::mt19937_64 rng{seed};
        std::ranges::shuffle(v, rng);
        seed = rng();
    }

    // Takes the top card, turning the discard pile into a fresh deck first when the deck is empty.
    // Returns nullptr when both piles are empty.
    template <typename T>
    auto Draw(std::vector<std::shared_ptr<T const>>& deck,
              std::vector<std::shared_ptr<T const>>& discard,
              std::uint64_t& seed) -> std::shared_ptr<T const>
    {
        if (deck.empty())
        {
            if (discard.empty()) return nullptr;
            deck = std::move(discard);
            discard.clear();
            Shuffle(deck, seed);
        }
        std::shared_ptr<T const> top = std::move(deck.front());
        deck.erase(deck.begin());
        return top;
    }

    template <typename T>
    auto Placeholders(std::vector<std::shared_ptr<T const>> const& pile) -> std::vector<std::shared_ptr<T const>>
    {
        return std::vector<std::shared_ptr<T const>>(pile.size());
    }
}

#endif //CASHFLOW_UTIL_HPP
