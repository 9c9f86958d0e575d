#include <gtest/gtest.h>

#include <cmath>

#include "../core/ClassicRules.hpp"
#include "../core/Evaluator.hpp"
#include "../core/Log.hpp"
#include "../core/SearchEngine.hpp"
#include "Fixtures.hpp"

using namespace mhl::core;
using mhl::test::MakeHand;

namespace
{
    constexpr auto Add = OperatorKind::Add;
    constexpr auto Sub = OperatorKind::Subtract;
    constexpr auto Div = OperatorKind::Divide;
    constexpr auto Root = SpecialKind::UnaryRoot;
    constexpr auto Times = SpecialKind::ForcedMultiply;

    class SearchEngineTest : public ::testing::Test
    {
    protected:
        void SetUp() override { log::SetLevel(log::Level::Warn); }

        ClassicRules rules_;
        SearchEngine engine_{rules_};
    };
}

TEST_F(SearchEngineTest, FindsExactTarget)
{
    Hand const h = MakeHand({4, 5, 11}, {Add, Add, Sub, Div});
    SearchResult const r = engine_.Search(h, 20);

    ASSERT_FALSE(r.expression.IsEmpty());
    EXPECT_EQ(r.expression.ToDisplayString(), "4 + 5 + 11");
    EXPECT_DOUBLE_EQ(r.distance, 0.0);
    EXPECT_TRUE(rules_.Validate(h, r.expression).has_value());
    EvaluationResult const v = Evaluate(r.expression);
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 20.0);
    EXPECT_FALSE(r.prioritized);
}

TEST_F(SearchEngineTest, EachOperatorCardIsUsedOnce)
{
    // a single Add card: 11 + 5 + 4 is out of reach
    Hand const h = MakeHand({4, 5, 11}, {Add, Sub, Div});
    SearchResult const r = engine_.Search(h, 20);

    EXPECT_EQ(r.expression.ToDisplayString(), "5 ÷ 4 + 11");
    EXPECT_DOUBLE_EQ(r.distance, 7.75);
    int adds = 0;
    for (OperatorKind const op : r.expression.Operators())
        if (op == Add) ++adds;
    EXPECT_EQ(adds, 1);
}

TEST_F(SearchEngineTest, UsesExactlyTheRequiredSpecials)
{
    Hand const h = MakeHand({2, 3, 4}, {Add, Sub, Div}, {Root, Times});
    SearchResult const r = engine_.Search(h, 10);

    ASSERT_FALSE(r.expression.IsEmpty());
    EXPECT_TRUE(r.prioritized);
    EXPECT_EQ(r.expression.RootCount(), 1);
    EXPECT_EQ(r.expression.MultiplyCount(), 1);
    EXPECT_TRUE(rules_.Validate(h, r.expression).has_value());
}

TEST_F(SearchEngineTest, TwoForcedMultipliesFillEverySlot)
{
    Hand const h = MakeHand({2, 3, 4}, {Add, Sub, Div}, {Times, Times});
    SearchResult const r = engine_.Search(h, 1);

    ASSERT_FALSE(r.expression.IsEmpty());
    EXPECT_EQ(r.expression.MultiplyCount(), 2);
    EXPECT_DOUBLE_EQ(r.distance, 23.0);
}

TEST_F(SearchEngineTest, IsDeterministic)
{
    Hand const h = MakeHand({7, 1, 9}, {Add, Sub, Div}, {Root});
    SearchResult const a = engine_.Search(h, 5);
    SearchResult const b = engine_.Search(h, 5);
    EXPECT_EQ(a.expression, b.expression);
    EXPECT_EQ(a.distance, b.distance);
    EXPECT_EQ(a.stats.candidates, b.stats.candidates);
}

TEST_F(SearchEngineTest, EmptyHandGivesEmptyExpression)
{
    SearchResult const r = engine_.Search(Hand{}, 5);
    EXPECT_TRUE(r.expression.IsEmpty());
    EXPECT_TRUE(std::isinf(r.distance));
    EXPECT_TRUE(engine_.FindBestExpression(MakeHand({}, {Add}), 5).IsEmpty());
}

TEST_F(SearchEngineTest, InfeasibleHandsGiveEmptyExpression)
{
    // two slots, one operator card
    EXPECT_TRUE(engine_.FindBestExpression(MakeHand({1, 2, 3}, {Add}), 6).IsEmpty());
    // forced multiply with no slot to put it in
    EXPECT_TRUE(engine_.FindBestExpression(MakeHand({5}, {Add}, {Times}), 5).IsEmpty());
    // every operator disabled
    Hand h = MakeHand({1, 2}, {Add});
    h.DisableOperator(Add);
    EXPECT_TRUE(engine_.FindBestExpression(h, 3).IsEmpty());
}

TEST_F(SearchEngineTest, SingleNumber)
{
    Expression const e = engine_.FindBestExpression(MakeHand({7}), 7);
    ASSERT_EQ(e.Terms().size(), 1u);
    EXPECT_EQ(e.Terms()[0].value, 7.0);
    EXPECT_TRUE(e.Operators().empty());
}

TEST_F(SearchEngineTest, DisabledOperatorsNeverAppear)
{
    Hand h = MakeHand({4, 5, 11});
    h.DisableOperator(Add);
    SearchResult const r = engine_.Search(h, 20);
    ASSERT_FALSE(r.expression.IsEmpty());
    for (OperatorKind const op : r.expression.Operators()) EXPECT_NE(op, Add);
}

TEST_F(SearchEngineTest, EqualValuesDoNotDuplicateBranches)
{
    // 1 distinct order x 3! operator orders
    EXPECT_EQ(engine_.Search(MakeHand({2, 2, 2}), 6).stats.candidates, 6u);
    // 3! number orders x 3! operator orders
    EXPECT_EQ(engine_.Search(MakeHand({1, 2, 3}), 6).stats.candidates, 36u);
}

TEST_F(SearchEngineTest, FirstFoundWinsTies)
{
    // 3 + 1 and 1 + 3 both hit 4; hand order is explored first
    Expression const e = engine_.FindBestExpression(MakeHand({3, 1}, {Add}), 4);
    ASSERT_EQ(e.Terms().size(), 2u);
    EXPECT_EQ(e.Terms()[0].value, 3.0);

    // √4 + 9 = 11, 4 + √9 = 7, √9 + 4 = 7, 9 + √4 = 11 -> first 7 wins
    Expression const rooted = engine_.FindBestExpression(MakeHand({4, 9}, {Add}, {Root}), 5);
    EXPECT_EQ(rooted.ToDisplayString(), "4 + √9");
}

TEST_F(SearchEngineTest, SkipsDivisionByZeroCandidates)
{
    Hand const h = MakeHand({5, 0, 3});
    SearchResult const r = engine_.Search(h, 8);
    EXPECT_GT(r.stats.rejected_eval, 0u);
    EXPECT_EQ(r.stats.internal_faults, 0u);
    EXPECT_EQ(r.stats.rejected_rules, 0u);
    EXPECT_DOUBLE_EQ(r.distance, 0.0);
}

TEST_F(SearchEngineTest, FallbackUsesHandOrder)
{
    EXPECT_EQ(SearchEngine::BuildFallback(MakeHand({4, 5, 11})).ToDisplayString(), "4 + 5 - 11");
    EXPECT_EQ(SearchEngine::BuildFallback(MakeHand({2, 3}, {Add}, {Root, Times})).ToDisplayString(), "√2 × 3");
    // operators run out -> Add
    EXPECT_EQ(SearchEngine::BuildFallback(MakeHand({1, 2, 3}, {Sub})).ToDisplayString(), "1 - 2 + 3");
    EXPECT_TRUE(SearchEngine::BuildFallback(Hand{}).IsEmpty());
}
