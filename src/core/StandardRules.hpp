//
// StandardRules.hpp
//

#ifndef CASHFLOW_STANDARDRULES_HPP
#define CASHFLOW_STANDARDRULES_HPP

#include "Rules.hpp"

namespace cashflow::core
{
    // Rat race plus fast track, as played at the table.
    class StandardRules final : public Rules
    {
    public:
        auto Validate(GameState const& state, GameAction const& a) const -> CheckResult override;
        auto Apply(GameState const& state, GameAction const& a) const -> GameState override;
        auto Advance(GameState& state) const -> void override;
        auto ValidActions(GameState const& state) const -> std::vector<ActionType> override;
    };
}

#endif //CASHFLOW_STANDARDRULES_HPP
