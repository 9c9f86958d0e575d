//
// Created by Malik T on 09/10/2025.
//

#ifndef MATHHIGHLOW_SCORING_HPP
#define MATHHIGHLOW_SCORING_HPP

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include "Exception.hpp"
#include "Expression.hpp"
#include "Hand.hpp"
#include "Rules.hpp"

namespace mhl::core
{
    enum class RoundWinner : uint8_t
    {
        Invalid = 0, // neither side produced a usable expression
        Draw,
        Player,
        AI
    };

    auto to_string(RoundWinner w) -> std::string_view;

    struct SideResult
    {
        Expression expression;
        std::optional<double> value;
        double distance{std::numeric_limits<double>::infinity()};

        // set when the expression failed validation or evaluation
        std::optional<error::RuleViolation> violation;
        std::string error;

        [[nodiscard]] auto Valid() const noexcept -> bool { return value.has_value(); }
    };

    struct RoundInputs
    {
        Rules const& rules;
        Hand const& player_hand;
        Hand const& ai_hand;
        Expression const& player_expr;
        Expression const& ai_expr;
        int target{};
        int bet{};
        uint32_t round{};
    };

    struct RoundResult
    {
        uint32_t round{};
        int target{};
        int bet{};

        SideResult player;
        SideResult ai;

        RoundWinner winner{RoundWinner::Invalid};
        int player_delta{};
        int ai_delta{};
    };

    // Validate against the side's own hand, then evaluate.
    [[nodiscard]] auto ScoreSide(Rules const& rules, Hand const& hand, Expression const& expr, int target) -> SideResult;

    [[nodiscard]] auto ScoreRound(RoundInputs const& in) -> RoundResult;

    // One-line "Round 3: Player wins (+2)" style summary
    [[nodiscard]] auto Summary(RoundResult const& r) -> std::string;
    // Multi-line expressions, values and distances for both sides
    [[nodiscard]] auto Detail(RoundResult const& r) -> std::string;
}

#endif //MATHHIGHLOW_SCORING_HPP
