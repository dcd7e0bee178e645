//
// Rules.hpp
//

#ifndef CASHFLOW_RULES_HPP
#define CASHFLOW_RULES_HPP

#include <vector>

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace cashflow::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& state, GameAction const& a) const -> CheckResult = 0;

        // Produces the successor state of a validated action. The input is never touched.
        virtual auto Apply(GameState const& state, GameAction const& a) const -> GameState = 0;

        // Bookkeeping that follows every applied action (escapes, forced bankruptcy, wins).
        virtual auto Advance(GameState& state) const -> void = 0;

        virtual auto ValidActions(GameState const& state) const -> std::vector<ActionType> = 0;
    };
}

#endif //CASHFLOW_RULES_HPP
