//
// Created by Malik T on 03/10/2025.
//

#include "Hand.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <type_traits>

#include <fmt/format.h>

#include "Card.hpp"

namespace mhl::core
{
    auto Hand::Clear() -> void
    {
        numbers_.clear();
        operators_.clear();
        specials_.clear();
        disabled_.clear();
    }

    auto Hand::AddCard(Card const& c) -> void
    {
        std::visit(
            [this]<typename T0>(T0 const& card)
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, NumberCard>) numbers_.push_back(card);
                else if constexpr (std::is_same_v<T, OperatorCard>) operators_.push_back(card);
                else specials_.push_back(card);
            },
            c);
    }

    template <typename Vec, typename C>
    static auto EraseFirst(Vec& v, C const& card) -> bool
    {
        auto const it = std::ranges::find(v, card);
        if (it == std::end(v)) return false;
        v.erase(it);
        return true;
    }

    auto Hand::RemoveCard(Card const& c) -> bool
    {
        return std::visit(
            [this]<typename T0>(T0 const& card) -> bool
            {
                using T = std::decay_t<T0>;

                if constexpr (std::is_same_v<T, NumberCard>) return EraseFirst(numbers_, card);
                else if constexpr (std::is_same_v<T, OperatorCard>) return EraseFirst(operators_, card);
                else return EraseFirst(specials_, card);
            },
            c);
    }

    auto Hand::MultiplyCount() const -> int
    {
        return static_cast<int>(std::ranges::count_if(specials_,
            [](SpecialCard const& s) { return s.kind == SpecialKind::ForcedMultiply; }));
    }

    auto Hand::RootCount() const -> int
    {
        return static_cast<int>(std::ranges::count_if(specials_,
            [](SpecialCard const& s) { return s.kind == SpecialKind::UnaryRoot; }));
    }

    auto Hand::IsOperatorEnabled(OperatorKind const op) const -> bool
    {
        return std::ranges::find(disabled_, op) == std::end(disabled_);
    }

    auto Hand::DisableOperator(OperatorKind const op) -> void
    {
        if (IsOperatorEnabled(op)) disabled_.push_back(op);
    }

    auto Hand::AvailableOperators() const -> std::vector<OperatorKind>
    {
        std::vector<OperatorKind> out;
        for (OperatorCard const& c : operators_)
        {
            if (!IsOperatorEnabled(c.op)) continue;
            if (std::ranges::find(out, c.op) == std::end(out)) out.push_back(c.op);
        }
        return out;
    }

    auto Hand::UsableOperatorCards() const -> std::vector<OperatorKind>
    {
        std::vector<OperatorKind> out;
        out.reserve(operators_.size());
        for (OperatorCard const& c : operators_)
        {
            if (IsOperatorEnabled(c.op)) out.push_back(c.op);
        }
        return out;
    }

    auto Hand::NumberValues() const -> std::vector<int>
    {
        std::vector<int> out;
        out.reserve(numbers_.size());
        std::ranges::transform(numbers_, std::back_inserter(out),
                               [](NumberCard const& n) { return n.value; });
        return out;
    }

    auto Hand::TotalCardCount() const noexcept -> size_t
    {
        return numbers_.size() + operators_.size() + specials_.size();
    }

    auto Hand::IsEmpty() const noexcept -> bool
    {
        return TotalCardCount() == 0;
    }

    auto Hand::ResetSpecialUsage() -> void
    {
        for (SpecialCard& s : specials_) s.consumed = false;
    }

    auto Hand::Summary() const -> std::string
    {
        // "[4 5 11] [+ - ÷] [√ ×]", disabled operators marked with '!'
        std::string out = "[";
        for (size_t i{}; i < numbers_.size(); ++i)
            out += fmt::format("{}{}", i ? " " : "", numbers_[i].value);
        out += "] [";
        for (size_t i{}; i < operators_.size(); ++i)
            out += fmt::format("{}{}{}", i ? " " : "", Symbol(operators_[i].op),
                               IsOperatorEnabled(operators_[i].op) ? "" : "!");
        out += "] [";
        for (size_t i{}; i < specials_.size(); ++i)
            out += fmt::format("{}{}", i ? " " : "", Symbol(specials_[i].kind));
        out += "]";
        return out;
    }
}
