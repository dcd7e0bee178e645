//
// Validator.hpp
//

#ifndef CASHFLOW_VALIDATOR_HPP
#define CASHFLOW_VALIDATOR_HPP

#include "Actions.hpp"
#include "Exception.hpp"
#include "State.hpp"

namespace cashflow::core
{
    // Decides whether an action is legal in the given state. Never mutates anything and never
    // throws for bad player input; the reason comes back in the unexpected branch.
    auto ValidateAction(GameState const& state, GameAction const& action) -> error::ValidateResult;
}

#endif //CASHFLOW_VALIDATOR_HPP
