//
// Created by Malik T on 09/10/2025.
//

#include "Scoring.hpp"

#include <cmath>

#include <fmt/format.h>

#include "Evaluator.hpp"

namespace mhl::core
{
    auto to_string(RoundWinner const w) -> std::string_view
    {
        switch (w)
        {
        case RoundWinner::Invalid: return "Invalid";
        case RoundWinner::Draw: return "Draw";
        case RoundWinner::Player: return "Player";
        case RoundWinner::AI: return "AI";
        }
        return "Unknown";
    }

    auto ScoreSide(Rules const& rules, Hand const& hand, Expression const& expr, int const target) -> SideResult
    {
        SideResult out;
        out.expression = expr;

        if (Rules::CheckResult const ok = rules.Validate(hand, expr); !ok.has_value())
        {
            out.violation = ok.error();
            out.error = error::describe(ok.error());
            return out;
        }

        EvaluationResult const value = Evaluate(expr);
        if (!value.has_value())
        {
            out.error = value.error().message;
            return out;
        }

        out.value = *value;
        out.distance = std::fabs(*value - static_cast<double>(target));
        return out;
    }

    static auto Decide(double const player, double const ai) -> RoundWinner
    {
        bool const p_inf = std::isinf(player);
        bool const a_inf = std::isinf(ai);

        if (p_inf && a_inf) return RoundWinner::Invalid;
        if (!p_inf && !a_inf && std::fabs(player - ai) < constants::DrawEpsilon) return RoundWinner::Draw;
        return player < ai ? RoundWinner::Player : RoundWinner::AI;
    }

    auto ScoreRound(RoundInputs const& in) -> RoundResult
    {
        RoundResult r;
        r.round = in.round;
        r.target = in.target;
        r.bet = in.bet;
        r.player = ScoreSide(in.rules, in.player_hand, in.player_expr, in.target);
        r.ai = ScoreSide(in.rules, in.ai_hand, in.ai_expr, in.target);

        r.winner = Decide(r.player.distance, r.ai.distance);
        switch (r.winner)
        {
        case RoundWinner::Player: r.player_delta = in.bet; break;
        case RoundWinner::AI: r.player_delta = -in.bet; break;
        case RoundWinner::Invalid:
        case RoundWinner::Draw: r.player_delta = 0; break;
        }
        r.ai_delta = -r.player_delta;
        return r;
    }

    auto Summary(RoundResult const& r) -> std::string
    {
        switch (r.winner)
        {
        case RoundWinner::Player: return fmt::format("Round {}: Player wins (+{})", r.round, r.player_delta);
        case RoundWinner::AI: return fmt::format("Round {}: AI wins (+{})", r.round, r.ai_delta);
        case RoundWinner::Draw: return fmt::format("Round {}: Draw", r.round);
        case RoundWinner::Invalid: return fmt::format("Round {}: no valid expression on either side", r.round);
        }
        return fmt::format("Round {}", r.round);
    }

    static auto DescribeSide(std::string_view who, SideResult const& s) -> std::string
    {
        std::string expr = s.expression.IsEmpty() ? std::string{"(empty)"} : s.expression.ToDisplayString();
        if (!s.Valid()) return fmt::format("{:<6} {} -> invalid: {}", who, expr, s.error);
        return fmt::format("{:<6} {} = {:.3f} (distance {:.3f})", who, expr, *s.value, s.distance);
    }

    auto Detail(RoundResult const& r) -> std::string
    {
        return fmt::format("Target {} | Bet {}\n{}\n{}\n{}",
                           r.target, r.bet,
                           DescribeSide("Player", r.player),
                           DescribeSide("AI", r.ai),
                           Summary(r));
    }
}
