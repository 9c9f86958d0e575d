//
// Created by Malik T on 03/10/2025.
//

#ifndef MATHHIGHLOW_EXPRESSION_HPP
#define MATHHIGHLOW_EXPRESSION_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "Types.hpp"

namespace mhl::core
{
    struct Term
    {
        double value{};
        bool has_root{false};
    };

    inline auto operator==(Term const& a, Term const& b) -> bool
    {
        return a.value == b.value && a.has_root == b.has_root;
    }

    // Alternating number/operator sequence, e.g. √4 × 3 + 2:
    //   terms     = [(4, root), (3, -), (2, -)]
    //   operators = [×, +]
    // Structural mutations only; game legality is the caller's (and the rules') job.
    // Plain value type: copies never share state.
    class Expression
    {
    public:
        auto AddNumber(double value, bool has_root = false) -> void;
        auto AddOperator(OperatorKind op) -> void;

        // Drops the last operator when operators == terms - 1 (and there is one),
        // otherwise drops the last number.
        auto RemoveLast() -> void;
        auto RemoveLastNumber() -> void;
        auto RemoveLastOperator() -> void;

        auto Clear() -> void;

        [[nodiscard]] auto IsEmpty() const noexcept -> bool { return terms_.empty(); }
        [[nodiscard]] auto IsComplete() const noexcept -> bool;
        [[nodiscard]] auto ExpectingNumber() const noexcept -> bool { return terms_.size() == operators_.size(); }

        auto Terms() const noexcept -> std::vector<Term> const& { return terms_; }
        auto Operators() const noexcept -> std::vector<OperatorKind> const& { return operators_; }

        [[nodiscard]] auto RootCount() const -> int;
        [[nodiscard]] auto MultiplyCount() const -> int;

        // "√4 × 3 + 2"; values printed with up to two decimals.
        [[nodiscard]] auto ToDisplayString() const -> std::string;

        friend auto operator==(Expression const& a, Expression const& b) -> bool
        {
            return a.terms_ == b.terms_ && a.operators_ == b.operators_;
        }

    private:
        std::vector<Term> terms_;
        std::vector<OperatorKind> operators_;
    };
}

#endif //MATHHIGHLOW_EXPRESSION_HPP
