#include <gtest/gtest.h>

#include <cmath>

#include "../core/ClassicRules.hpp"
#include "../core/Scoring.hpp"
#include "Fixtures.hpp"

using namespace mhl::core;
using mhl::test::MakeExpr;
using mhl::test::MakeHand;

namespace
{
    constexpr auto Add = OperatorKind::Add;
    constexpr auto Sub = OperatorKind::Subtract;
    constexpr auto Div = OperatorKind::Divide;

    auto Score(Expression const& player, Expression const& ai, int target = 20, int bet = 3) -> RoundResult
    {
        static ClassicRules const rules{};
        static Hand const player_hand = MakeHand({4, 5, 11});
        static Hand const ai_hand = MakeHand({2, 6, 9});
        return ScoreRound(RoundInputs{
            .rules = rules,
            .player_hand = player_hand,
            .ai_hand = ai_hand,
            .player_expr = player,
            .ai_expr = ai,
            .target = target,
            .bet = bet,
            .round = 1
        });
    }
}

TEST(Scoring, CloserSideWinsTheBet)
{
    // 11 + 5 + 4 = 20, 9 + 6 + 2 = 17
    RoundResult const r = Score(MakeExpr({{11}, {5}, {4}}, {Add, Add}), MakeExpr({{9}, {6}, {2}}, {Add, Add}));
    EXPECT_EQ(r.winner, RoundWinner::Player);
    EXPECT_EQ(r.player_delta, 3);
    EXPECT_EQ(r.ai_delta, -3);
    EXPECT_DOUBLE_EQ(r.player.distance, 0.0);
    EXPECT_DOUBLE_EQ(r.ai.distance, 3.0);
    EXPECT_EQ(Summary(r), "Round 1: Player wins (+3)");
}

TEST(Scoring, AIWin)
{
    // 11 - 5 - 4 = 2, 9 + 6 + 2 = 17
    RoundResult const r = Score(MakeExpr({{11}, {5}, {4}}, {Sub, Sub}), MakeExpr({{9}, {6}, {2}}, {Add, Add}));
    EXPECT_EQ(r.winner, RoundWinner::AI);
    EXPECT_EQ(r.player_delta, -3);
    EXPECT_EQ(r.ai_delta, 3);
}

TEST(Scoring, EqualDistanceIsDraw)
{
    ClassicRules const rules{};
    Hand const h = MakeHand({4, 5, 11});
    // 11 + 5 - 4 = 12 and 4 + 5 + 11 = 20 are both 4 away from 16
    Expression const low = MakeExpr({{11}, {5}, {4}}, {Add, Sub});
    Expression const high = MakeExpr({{4}, {5}, {11}}, {Add, Add});

    RoundResult const r = ScoreRound(RoundInputs{
        .rules = rules, .player_hand = h, .ai_hand = h,
        .player_expr = low, .ai_expr = high, .target = 16, .bet = 2, .round = 4
    });
    EXPECT_EQ(r.winner, RoundWinner::Draw);
    EXPECT_EQ(r.player_delta, 0);
    EXPECT_EQ(r.ai_delta, 0);
    EXPECT_EQ(Summary(r), "Round 4: Draw");
}

TEST(Scoring, InvalidSideHasInfiniteDistance)
{
    RoundResult const r = Score(MakeExpr({{11}, {5}}, {Add}), MakeExpr({{9}, {6}, {2}}, {Add, Add}));
    EXPECT_FALSE(r.player.Valid());
    EXPECT_TRUE(std::isinf(r.player.distance));
    ASSERT_TRUE(r.player.violation.has_value());
    EXPECT_EQ(r.player.violation->code, error::RuleViolationCode::Numbers_Missing);
    EXPECT_EQ(r.player.error, "Numbers: card not used | value=4 | by=1 | required=1 | used=0");
    EXPECT_EQ(r.winner, RoundWinner::AI);
}

TEST(Scoring, EvaluationFailureIsInvalid)
{
    Hand const h = MakeHand({4, 0, 11});
    SideResult const s = ScoreSide(ClassicRules{}, h, MakeExpr({{4}, {0}, {11}}, {Div, Add}), 20);
    EXPECT_FALSE(s.Valid());
    EXPECT_FALSE(s.violation.has_value());
    EXPECT_EQ(s.error, "division by zero");
}

TEST(Scoring, ResultCarriesRoundInputs)
{
    Expression const p = MakeExpr({{11}, {5}, {4}}, {Add, Sub});
    RoundResult const r = Score(p, MakeExpr({{9}, {6}, {2}}, {Add, Add}), 12, 4);
    EXPECT_EQ(r.round, 1u);
    EXPECT_EQ(r.target, 12);
    EXPECT_EQ(r.bet, 4);
    EXPECT_EQ(r.player.expression, p);
    ASSERT_TRUE(r.player.value.has_value());
    EXPECT_DOUBLE_EQ(*r.player.value, 12.0);
    EXPECT_FALSE(r.player.violation.has_value());
    EXPECT_TRUE(r.player.error.empty());
}

TEST(Scoring, BothInvalid)
{
    RoundResult const r = Score(Expression{}, Expression{});
    EXPECT_EQ(r.winner, RoundWinner::Invalid);
    EXPECT_EQ(r.player_delta, 0);
    EXPECT_EQ(r.ai_delta, 0);
}
