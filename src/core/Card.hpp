//
// Created by Malik T on 02/10/2025.
//

#ifndef MATHHIGHLOW_CARD_HPP
#define MATHHIGHLOW_CARD_HPP

#include <string>
#include <string_view>

#include "Types.hpp"

namespace mhl::core
{
    auto Symbol(OperatorKind op) noexcept -> std::string_view;
    auto Symbol(SpecialKind kind) noexcept -> std::string_view;

    // "+", "7", "√" ...
    auto DisplayText(Card const& c) -> std::string;

    // "Number" | "Operator" | "Special"
    auto TypeName(Card const& c) noexcept -> std::string_view;

    // Independent copy; special cards come back unconsumed.
    auto Clone(Card const& c) -> Card;

    inline auto IsSameType(Card const& a, Card const& b) noexcept -> bool
    {
        return a.index() == b.index();
    }

    inline auto IsNumber(Card const& c) noexcept -> bool { return std::holds_alternative<NumberCard>(c); }
    inline auto IsSpecial(Card const& c) noexcept -> bool { return std::holds_alternative<SpecialCard>(c); }
}

#endif //MATHHIGHLOW_CARD_HPP
