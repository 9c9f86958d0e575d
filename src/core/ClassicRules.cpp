//
// Created by Malik T on 04/10/2025.
//

#include "ClassicRules.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <ranges>

namespace
{
    inline auto Viol(mhl::core::error::RuleViolationCode code) -> mhl::core::error::RuleViolation
    {
        return mhl::core::error::RuleViolation{ .code = code };
    }
}

namespace mhl::core
{
    static auto CountHeld(Hand const& hand) -> std::map<int, int>
    {
        std::map<int, int> held;
        for (NumberCard const& n : hand.Numbers()) ++held[n.value];
        return held;
    }

    static auto CountUsed(Expression const& expr) -> std::map<int, int>
    {
        std::map<int, int> used;
        for (Term const& t : expr.Terms()) ++used[static_cast<int>(std::lround(t.value))];
        return used;
    }

    static auto CheckNumbers(Hand const& hand, Expression const& expr) -> Rules::CheckResult
    {
        using RVC = error::RuleViolationCode;

        std::map<int, int> const held = CountHeld(hand);
        std::map<int, int> const used = CountUsed(expr);

        for (auto const& [value, available] : held)
        {
            auto const it = used.find(value);
            int const n = (it == used.end()) ? 0 : it->second;

            if (n < available)
                return std::unexpected(Viol(RVC::Numbers_Missing)
                                       .with_value(value).with_discrepancy(available - n)
                                       .with_required(available).with_used(n));
            if (n > available)
                return std::unexpected(Viol(RVC::Numbers_Surplus)
                                       .with_value(value).with_discrepancy(n - available)
                                       .with_required(available).with_used(n));
        }

        for (auto const& [value, n] : used)
        {
            if (!held.contains(value))
                return std::unexpected(Viol(RVC::Numbers_Foreign)
                                       .with_value(value).with_discrepancy(n)
                                       .with_required(0).with_used(n));
        }
        return {};
    }

    auto ClassicRules::Validate(Hand const& hand, Expression const& expr) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        if (expr.IsEmpty())
            return std::unexpected(Viol(RVC::Expr_Empty));

        if (!expr.IsComplete())
            return std::unexpected(Viol(RVC::Expr_Incomplete)
                                   .with_required(static_cast<int>(expr.Terms().size()) - 1)
                                   .with_used(static_cast<int>(expr.Operators().size())));

        if (auto ok = CheckNumbers(hand, expr); !ok.has_value())
            return ok;

        int const roots_req = hand.RootCount();
        int const roots_used = expr.RootCount();
        if (roots_used < roots_req)
            return std::unexpected(Viol(RVC::Root_Missing)
                                   .with_discrepancy(roots_req - roots_used)
                                   .with_required(roots_req).with_used(roots_used));
        if (roots_used > roots_req)
            return std::unexpected(Viol(RVC::Root_Surplus)
                                   .with_discrepancy(roots_used - roots_req)
                                   .with_required(roots_req).with_used(roots_used));

        int const mul_req = hand.MultiplyCount();
        int const mul_used = expr.MultiplyCount();
        if (mul_used < mul_req)
            return std::unexpected(Viol(RVC::Multiply_Missing)
                                   .with_discrepancy(mul_req - mul_used)
                                   .with_required(mul_req).with_used(mul_used));
        if (mul_used > mul_req)
            return std::unexpected(Viol(RVC::Multiply_Surplus)
                                   .with_discrepancy(mul_used - mul_req)
                                   .with_required(mul_req).with_used(mul_used));

        for (OperatorKind const op : expr.Operators())
        {
            if (op == OperatorKind::Multiply) continue;
            if (!hand.IsOperatorEnabled(op))
                return std::unexpected(Viol(RVC::Operator_Disabled).with_op(op));
        }

        return {};
    }
}
