//
// Agent.hpp
//

#ifndef CASHFLOW_AGENT_HPP
#define CASHFLOW_AGENT_HPP

#include <optional>

#include "Actions.hpp"
#include "State.hpp"

namespace cashflow::core
{
    // Anything that can sit in a seat: local bots, the network bot, test scripts.
    class Agent
    {
    public:
        virtual ~Agent() = default;

        // Called with the state as the seat sees it (decks may be placeholders).
        // nullopt means the seat has nothing to do right now.
        virtual auto Play(GameState const& view, PlayerId const& me) -> std::optional<GameAction> = 0;
    };
}

#endif //CASHFLOW_AGENT_HPP
