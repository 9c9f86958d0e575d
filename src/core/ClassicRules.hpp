//
// Created by Malik T on 04/10/2025.
//

#ifndef MATHHIGHLOW_CLASSICRULES_HPP
#define MATHHIGHLOW_CLASSICRULES_HPP
#include "Rules.hpp"

namespace mhl::core
{
    // Standard legality pipeline, first failing stage wins:
    //   empty -> complete -> number multiset -> roots == S -> multiplies == M -> no disabled operator.
    // Multiply is exempt from the disabled check; the specials, not operator cards, govern it.
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(Hand const& hand, Expression const& expr) const -> CheckResult override;
    };
}

#endif //MATHHIGHLOW_CLASSICRULES_HPP
