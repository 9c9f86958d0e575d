//
// Created by Malik T on 08/10/2025.
//

#ifndef MATHHIGHLOW_EXPRESSIONBUILDER_HPP
#define MATHHIGHLOW_EXPRESSIONBUILDER_HPP

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>

#include "Exception.hpp"
#include "Expression.hpp"
#include "Hand.hpp"

namespace mhl::core
{
    // Card-by-card construction of an expression from a hand, the way a human plays it.
    // Indices refer to Hand::Numbers(), Hand::Operators() and Hand::Specials().
    // Each card is used at most once; Undo returns the last placed card to the hand.
    class ExpressionBuilder
    {
    public:
        using StepResult = std::expected<void, error::BuildRejection>;

        explicit ExpressionBuilder(Hand hand);

        auto PlayNumber(size_t idx) -> StepResult;
        auto PlayOperator(size_t idx) -> StepResult;
        auto PlayForcedMultiply(size_t idx) -> StepResult;
        // Marks a root as pending; it applies to the next number played.
        auto PlayRoot(size_t idx) -> StepResult;

        auto Undo() -> StepResult;
        auto Reset() -> void;

        [[nodiscard]] auto HasUnusedNumbers() const -> bool;
        [[nodiscard]] auto UsedAllRequiredSpecials() const -> bool;
        // All numbers placed and the expression ends on a number, but a special is still unused.
        [[nodiscard]] auto NeedsSpecialReminder() const -> bool;
        [[nodiscard]] auto RootPending() const noexcept -> bool { return pending_root_.has_value(); }

        auto Current() const noexcept -> Expression const& { return expr_; }
        auto HandView() const noexcept -> Hand const& { return hand_; }

        auto IsNumberUsed(size_t idx) const -> bool { return numbers_used_.at(idx); }
        auto IsOperatorUsed(size_t idx) const -> bool { return operators_used_.at(idx); }
        auto IsSpecialUsed(size_t idx) const -> bool { return specials_used_.at(idx); }

    private:
        enum class Placed : uint8_t
        {
            Number,
            Operator,
            ForcedMultiply
        };

        struct Placement
        {
            Placed kind;
            size_t index;
            std::optional<size_t> root; // root special consumed by this number
        };

        auto CanFollowWithNumber() const -> bool { return HasUnusedNumbers(); }

    private:
        Hand hand_;
        Expression expr_;

        std::vector<bool> numbers_used_;
        std::vector<bool> operators_used_;
        std::vector<bool> specials_used_;

        std::optional<size_t> pending_root_;
        std::vector<Placement> placed_;
    };
}

#endif //MATHHIGHLOW_EXPRESSIONBUILDER_HPP
