#ifndef MATHHIGHLOW_TEST_FIXTURES_HPP
#define MATHHIGHLOW_TEST_FIXTURES_HPP

#include <initializer_list>

#include "../core/Expression.hpp"
#include "../core/Hand.hpp"
#include "../core/Types.hpp"

namespace mhl::test
{
    using namespace mhl::core;

    inline auto MakeHand(std::initializer_list<int> numbers,
                         std::initializer_list<OperatorKind> ops = {OperatorKind::Add, OperatorKind::Subtract, OperatorKind::Divide},
                         std::initializer_list<SpecialKind> specials = {}) -> Hand
    {
        Hand h;
        for (int const n : numbers) h.AddCard(NumberCard{n});
        for (OperatorKind const op : ops) h.AddCard(OperatorCard{op});
        for (SpecialKind const k : specials) h.AddCard(SpecialCard{k});
        return h;
    }

    struct TermSpec
    {
        double value;
        bool root{false};
    };

    // MakeExpr({{4}, {3}, {2}}, {Multiply, Add}) -> 4 × 3 + 2
    inline auto MakeExpr(std::initializer_list<TermSpec> terms, std::initializer_list<OperatorKind> ops = {}) -> Expression
    {
        Expression e;
        auto op = ops.begin();
        for (TermSpec const& t : terms)
        {
            e.AddNumber(t.value, t.root);
            if (op != ops.end()) e.AddOperator(*op++);
        }
        return e;
    }
}

#endif //MATHHIGHLOW_TEST_FIXTURES_HPP
