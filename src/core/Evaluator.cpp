//
// Created by Malik T on 04/10/2025.
//

#include "Evaluator.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace mhl::core
{
    static auto Fault(error::EvalCode const c) -> std::unexpected<error::EvalFault>
    {
        return std::unexpected(error::EvalFault{.code = c, .message = std::string{error::to_string(c)}});
    }

    auto Precedence(OperatorKind const op) noexcept -> int
    {
        switch (op)
        {
        case OperatorKind::Multiply:
        case OperatorKind::Divide: return 2;
        case OperatorKind::Add:
        case OperatorKind::Subtract: return 1;
        }
        return 0;
    }

    auto ApplyOperator(double const lhs, OperatorKind const op, double const rhs) -> EvaluationResult
    {
        switch (op)
        {
        case OperatorKind::Add: return lhs + rhs;
        case OperatorKind::Subtract: return lhs - rhs;
        case OperatorKind::Multiply: return lhs * rhs;
        case OperatorKind::Divide:
            if (std::fabs(rhs) < constants::DivideEpsilon) return Fault(error::EvalCode::DivisionByZero);
            return lhs / rhs;
        }
        return Fault(error::EvalCode::Malformed);
    }

    // pass 1
    static auto ApplyRoots(Expression const& expr) -> std::expected<std::vector<double>, error::EvalFault>
    {
        std::vector<double> out;
        out.reserve(expr.Terms().size());
        for (Term const& t : expr.Terms())
        {
            if (!t.has_root)
            {
                out.push_back(t.value);
                continue;
            }
            if (t.value < 0.0) return Fault(error::EvalCode::NegativeRoot);
            out.push_back(std::sqrt(t.value));
        }
        return out;
    }

    static auto CheckShape(Expression const& expr) -> std::expected<void, error::EvalFault>
    {
        if (expr.IsEmpty()) return Fault(error::EvalCode::EmptyExpression);
        if (!expr.IsComplete()) return Fault(error::EvalCode::Malformed);
        return {};
    }

    // Pops two operands and one operator, pushes the result.
    static auto Reduce(std::vector<double>& operands, std::vector<OperatorKind>& ops) -> std::expected<void, error::EvalFault>
    {
        if (operands.size() < 2 || ops.empty()) return Fault(error::EvalCode::Internal_OperandUnderflow);

        double const rhs = operands.back();
        operands.pop_back();
        double const lhs = operands.back();
        operands.pop_back();
        OperatorKind const op = ops.back();
        ops.pop_back();

        EvaluationResult const r = ApplyOperator(lhs, op, rhs);
        if (!r.has_value()) return std::unexpected(r.error());
        operands.push_back(*r);
        return {};
    }

    auto Evaluate(Expression const& expr) -> EvaluationResult
    {
        if (auto shape = CheckShape(expr); !shape.has_value()) return std::unexpected(shape.error());

        auto rooted = ApplyRoots(expr);
        if (!rooted.has_value()) return std::unexpected(rooted.error());
        std::vector<double> const& numbers = *rooted;
        std::vector<OperatorKind> const& operators = expr.Operators();

        // pass 2: dual stack
        std::vector<double> operands;
        std::vector<OperatorKind> ops;
        operands.reserve(numbers.size());
        ops.reserve(operators.size());

        operands.push_back(numbers[0]);
        for (size_t i{}; i < operators.size(); ++i)
        {
            OperatorKind const incoming = operators[i];
            // >= keeps equal precedence left to right
            while (!ops.empty() && Precedence(ops.back()) >= Precedence(incoming))
            {
                if (auto ok = Reduce(operands, ops); !ok.has_value()) return std::unexpected(ok.error());
            }
            ops.push_back(incoming);
            operands.push_back(numbers[i + 1]);
        }

        while (!ops.empty())
        {
            if (auto ok = Reduce(operands, ops); !ok.has_value()) return std::unexpected(ok.error());
        }

        if (operands.size() != 1) return Fault(error::EvalCode::Internal_OperandUnderflow);
        return operands.back();
    }

    auto EvaluateLeftToRight(Expression const& expr) -> EvaluationResult
    {
        if (auto shape = CheckShape(expr); !shape.has_value()) return std::unexpected(shape.error());

        auto rooted = ApplyRoots(expr);
        if (!rooted.has_value()) return std::unexpected(rooted.error());
        std::vector<double> const& numbers = *rooted;

        double acc = numbers[0];
        for (size_t i{}; i < expr.Operators().size(); ++i)
        {
            EvaluationResult const r = ApplyOperator(acc, expr.Operators()[i], numbers[i + 1]);
            if (!r.has_value()) return r;
            acc = *r;
        }
        return acc;
    }
}
