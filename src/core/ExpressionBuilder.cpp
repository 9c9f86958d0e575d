//
// Created by Malik T on 08/10/2025.
//

#include "ExpressionBuilder.hpp"

#include <algorithm>
#include <utility>

namespace mhl::core
{
    using error::BuildRejection;

    static auto Reject(BuildRejection const r) -> std::unexpected<BuildRejection>
    {
        return std::unexpected(r);
    }

    ExpressionBuilder::ExpressionBuilder(Hand hand) :
        hand_(std::move(hand))
    {
        Reset();
    }

    auto ExpressionBuilder::Reset() -> void
    {
        expr_.Clear();
        numbers_used_.assign(hand_.Numbers().size(), false);
        operators_used_.assign(hand_.Operators().size(), false);
        specials_used_.assign(hand_.Specials().size(), false);
        pending_root_.reset();
        placed_.clear();
    }

    auto ExpressionBuilder::PlayNumber(size_t const idx) -> StepResult
    {
        if (!expr_.ExpectingNumber()) return Reject(BuildRejection::NumberNotExpected);
        if (idx >= numbers_used_.size()) return Reject(BuildRejection::CardIndexOutOfRange);
        if (numbers_used_[idx]) return Reject(BuildRejection::CardAlreadyUsed);

        bool const rooted = pending_root_.has_value();
        expr_.AddNumber(hand_.Numbers()[idx].value, rooted);
        numbers_used_[idx] = true;
        placed_.push_back(Placement{.kind = Placed::Number, .index = idx, .root = pending_root_});
        pending_root_.reset();
        return {};
    }

    auto ExpressionBuilder::PlayOperator(size_t const idx) -> StepResult
    {
        if (expr_.IsEmpty() || expr_.ExpectingNumber()) return Reject(BuildRejection::OperatorNotExpected);
        if (idx >= operators_used_.size()) return Reject(BuildRejection::CardIndexOutOfRange);
        if (operators_used_[idx]) return Reject(BuildRejection::CardAlreadyUsed);

        OperatorKind const op = hand_.Operators()[idx].op;
        if (!hand_.IsOperatorEnabled(op)) return Reject(BuildRejection::OperatorDisabled);
        if (!CanFollowWithNumber()) return Reject(BuildRejection::NoNumbersLeft);

        expr_.AddOperator(op);
        operators_used_[idx] = true;
        placed_.push_back(Placement{.kind = Placed::Operator, .index = idx, .root = std::nullopt});
        return {};
    }

    auto ExpressionBuilder::PlayForcedMultiply(size_t const idx) -> StepResult
    {
        if (expr_.IsEmpty() || expr_.ExpectingNumber()) return Reject(BuildRejection::OperatorNotExpected);
        if (idx >= specials_used_.size()) return Reject(BuildRejection::CardIndexOutOfRange);
        if (specials_used_[idx]) return Reject(BuildRejection::CardAlreadyUsed);
        if (hand_.Specials()[idx].kind != SpecialKind::ForcedMultiply) return Reject(BuildRejection::WrongSpecialKind);
        if (!CanFollowWithNumber()) return Reject(BuildRejection::NoNumbersLeft);

        expr_.AddOperator(OperatorKind::Multiply);
        specials_used_[idx] = true;
        hand_.SpecialAt(idx).consumed = true;
        placed_.push_back(Placement{.kind = Placed::ForcedMultiply, .index = idx, .root = std::nullopt});
        return {};
    }

    auto ExpressionBuilder::PlayRoot(size_t const idx) -> StepResult
    {
        if (pending_root_.has_value()) return Reject(BuildRejection::RootAlreadyPending);
        if (!expr_.ExpectingNumber()) return Reject(BuildRejection::NumberNotExpected);
        if (idx >= specials_used_.size()) return Reject(BuildRejection::CardIndexOutOfRange);
        if (specials_used_[idx]) return Reject(BuildRejection::CardAlreadyUsed);
        if (hand_.Specials()[idx].kind != SpecialKind::UnaryRoot) return Reject(BuildRejection::WrongSpecialKind);
        if (!CanFollowWithNumber()) return Reject(BuildRejection::NoNumbersLeft);

        specials_used_[idx] = true;
        hand_.SpecialAt(idx).consumed = true;
        pending_root_ = idx;
        return {};
    }

    auto ExpressionBuilder::Undo() -> StepResult
    {
        if (pending_root_.has_value())
        {
            specials_used_[*pending_root_] = false;
            hand_.SpecialAt(*pending_root_).consumed = false;
            pending_root_.reset();
            return {};
        }
        if (placed_.empty()) return Reject(BuildRejection::NothingToUndo);

        Placement const last = placed_.back();
        placed_.pop_back();

        switch (last.kind)
        {
        case Placed::Number:
            expr_.RemoveLastNumber();
            numbers_used_[last.index] = false;
            if (last.root.has_value())
            {
                specials_used_[*last.root] = false;
                hand_.SpecialAt(*last.root).consumed = false;
            }
            break;
        case Placed::Operator:
            expr_.RemoveLastOperator();
            operators_used_[last.index] = false;
            break;
        case Placed::ForcedMultiply:
            expr_.RemoveLastOperator();
            specials_used_[last.index] = false;
            hand_.SpecialAt(last.index).consumed = false;
            break;
        }
        return {};
    }

    auto ExpressionBuilder::HasUnusedNumbers() const -> bool
    {
        return std::ranges::find(numbers_used_, false) != numbers_used_.end();
    }

    auto ExpressionBuilder::UsedAllRequiredSpecials() const -> bool
    {
        return std::ranges::all_of(specials_used_, [](bool const u) { return u; });
    }

    auto ExpressionBuilder::NeedsSpecialReminder() const -> bool
    {
        return !HasUnusedNumbers() && !expr_.IsEmpty() && !expr_.ExpectingNumber() && !UsedAllRequiredSpecials();
    }
}
