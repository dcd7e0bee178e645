//
// RandomAgent.hpp
//

#ifndef CASHFLOW_RANDOMAGENT_HPP
#define CASHFLOW_RANDOMAGENT_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "Agent.hpp"

namespace cashflow::core
{
    // Picks uniformly among the actions the validator would accept, with a lean towards
    // ending the turn so games keep moving.
    class RandomAgent final : public Agent
    {
    public:
        explicit RandomAgent(std::uint64_t rng_seed);

        auto Play(GameState const& view, PlayerId const& me) -> std::optional<GameAction> override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto coin() -> bool { return std::bernoulli_distribution{0.5}(rng_); }

        // Concrete candidates for one action type; empty when the type cannot be filled in.
        auto Candidates(GameState const& s, Player const& p, ActionType t) -> std::vector<GameAction>;

    private:
        std::mt19937_64 rng_;
    };
}

#endif //CASHFLOW_RANDOMAGENT_HPP
