//
// Created by Malik T on 04/10/2025.
//

#ifndef MATHHIGHLOW_EVALUATOR_HPP
#define MATHHIGHLOW_EVALUATOR_HPP

#include <expected>

#include "Exception.hpp"
#include "Expression.hpp"

namespace mhl::core
{
    using EvaluationResult = std::expected<double, error::EvalFault>;

    // Multiply/Divide = 2, Add/Subtract = 1
    [[nodiscard]] auto Precedence(OperatorKind op) noexcept -> int;

    [[nodiscard]] auto ApplyOperator(double lhs, OperatorKind op, double rhs) -> EvaluationResult;

    // Roots first, then standard precedence with left-to-right ties.
    // Safe on unvalidated input: empty or malformed expressions come back as faults.
    [[nodiscard]] auto Evaluate(Expression const& expr) -> EvaluationResult;

    // Roots first, then strictly left to right ignoring precedence.
    [[nodiscard]] auto EvaluateLeftToRight(Expression const& expr) -> EvaluationResult;
}

#endif //MATHHIGHLOW_EVALUATOR_HPP
