//
// Created by Malik T on 02/10/2025.
//

#include "Card.hpp"

#include <type_traits>

namespace mhl::core
{
    auto Symbol(OperatorKind const op) noexcept -> std::string_view
    {
        switch (op)
        {
        case OperatorKind::Add: return "+";
        case OperatorKind::Subtract: return "-";
        case OperatorKind::Multiply: return "×";
        case OperatorKind::Divide: return "÷";
        }
        return "?";
    }

    auto Symbol(SpecialKind const kind) noexcept -> std::string_view
    {
        switch (kind)
        {
        case SpecialKind::ForcedMultiply: return "×";
        case SpecialKind::UnaryRoot: return "√";
        }
        return "?";
    }

    auto DisplayText(Card const& c) -> std::string
    {
        return std::visit(
            []<typename T0>(T0 const& card) -> std::string
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, NumberCard>)
                {
                    return std::to_string(card.value);
                }
                else if constexpr (std::is_same_v<T, OperatorCard>)
                {
                    return std::string{Symbol(card.op)};
                }
                else
                {
                    return std::string{Symbol(card.kind)};
                }
            },
            c);
    }

    auto TypeName(Card const& c) noexcept -> std::string_view
    {
        return std::visit(
            []<typename T0>(T0 const&) -> std::string_view
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, NumberCard>) return "Number";
                else if constexpr (std::is_same_v<T, OperatorCard>) return "Operator";
                else return "Special";
            },
            c);
    }

    auto Clone(Card const& c) -> Card
    {
        return std::visit(
            []<typename T0>(T0 const& card) -> Card
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, SpecialCard>)
                {
                    return SpecialCard{.kind = card.kind, .consumed = false};
                }
                else
                {
                    return card;
                }
            },
            c);
    }
}
