//
// Created by Malik T on 04/10/2025.
//

#ifndef MATHHIGHLOW_RULES_HPP
#define MATHHIGHLOW_RULES_HPP

#include "Exception.hpp"
#include "Expression.hpp"
#include "Hand.hpp"

namespace mhl::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Hand const& hand, Expression const& expr) const -> CheckResult = 0;
    };
}

#endif //MATHHIGHLOW_RULES_HPP
