//
// Created by Malik T on 03/10/2025.
//

#include "Expression.hpp"

#include <algorithm>
#include <ranges>

#include <fmt/format.h>

#include "Card.hpp"

namespace mhl::core
{
    auto Expression::AddNumber(double const value, bool const has_root) -> void
    {
        terms_.push_back(Term{.value = value, .has_root = has_root});
    }

    auto Expression::AddOperator(OperatorKind const op) -> void
    {
        operators_.push_back(op);
    }

    auto Expression::RemoveLast() -> void
    {
        if (!operators_.empty() && operators_.size() + 1 == terms_.size())
        {
            operators_.pop_back();
        }
        else if (!terms_.empty())
        {
            terms_.pop_back();
        }
    }

    auto Expression::RemoveLastNumber() -> void
    {
        if (!terms_.empty()) terms_.pop_back();
    }

    auto Expression::RemoveLastOperator() -> void
    {
        if (!operators_.empty()) operators_.pop_back();
    }

    auto Expression::Clear() -> void
    {
        terms_.clear();
        operators_.clear();
    }

    auto Expression::IsComplete() const noexcept -> bool
    {
        return !terms_.empty() && operators_.size() + 1 == terms_.size();
    }

    auto Expression::RootCount() const -> int
    {
        return static_cast<int>(std::ranges::count_if(terms_, [](Term const& t) { return t.has_root; }));
    }

    auto Expression::MultiplyCount() const -> int
    {
        return static_cast<int>(std::ranges::count(operators_, OperatorKind::Multiply));
    }

    // 4 -> "4", 2.5 -> "2.5", 1.41421 -> "1.41"
    static auto FormatValue(double const v) -> std::string
    {
        std::string s = fmt::format("{:.2f}", v);
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
        if (s == "-0") s = "0";
        return s;
    }

    auto Expression::ToDisplayString() const -> std::string
    {
        std::string out;
        for (size_t i{}; i < terms_.size(); ++i)
        {
            if (terms_[i].has_root) out += Symbol(SpecialKind::UnaryRoot);
            out += FormatValue(terms_[i].value);

            if (i < operators_.size())
            {
                out += fmt::format(" {} ", Symbol(operators_[i]));
            }
        }
        return out;
    }
}
