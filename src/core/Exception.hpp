//
// Created by Malik T on 02/10/2025.
//

#ifndef MATHHIGHLOW_EXCEPTION_HPP
#define MATHHIGHLOW_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "Types.hpp"

namespace mhl::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a user invalid expression)
        State, // game state misuse
        Deck, // deck could not supply a card
        Config, // configuration cannot produce a playable round
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct DeckError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Deck: throw DeckError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define MHL_THROW(code_enum, msg) ::mhl::core::error::fail((code_enum), (msg))
#define MHL_ASSERT(cond, msg) do { if(!(cond)) ::mhl::core::error::fail(::mhl::core::error::Code::Assertion, (msg)); } while(0)

    // Shown to the player for any rejected expression; the detail goes to logs.
    inline constexpr std::string_view GeneralFailureMessage = "Expression is not complete.";

    // One code per validation stage outcome, in pipeline order.
    enum class RuleViolationCode : std::uint16_t
    {
        // Structure
        Expr_Empty,
        Expr_Incomplete,

        // Number cards
        Numbers_Missing,
        Numbers_Surplus,
        Numbers_Foreign, // value not held at all

        // Specials
        Root_Missing,
        Root_Surplus,
        Multiply_Missing,
        Multiply_Surplus,

        // Operators
        Operator_Disabled,

        // Safety net
        Internal_Unreachable
    };

    struct RuleViolation
    {
        RuleViolationCode code{};

        std::optional<int> value{};          // number value involved
        std::optional<int> discrepancy{};    // how many too few / too many
        std::optional<int> required{};
        std::optional<int> used{};
        std::optional<OperatorKind> op{};

        auto with_value(int v) -> RuleViolation&
        {
            value = v;
            return *this;
        }

        auto with_discrepancy(int d) -> RuleViolation&
        {
            discrepancy = d;
            return *this;
        }

        auto with_required(int r) -> RuleViolation&
        {
            required = r;
            return *this;
        }

        auto with_used(int u) -> RuleViolation&
        {
            used = u;
            return *this;
        }

        auto with_op(OperatorKind o) -> RuleViolation&
        {
            op = o;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Expr_Empty: return "Expression is empty";
        case E::Expr_Incomplete: return "Expression is not complete";
        case E::Numbers_Missing: return "Numbers: card not used";
        case E::Numbers_Surplus: return "Numbers: card used too often";
        case E::Numbers_Foreign: return "Numbers: value not in hand";
        case E::Root_Missing: return "Root: required root not used";
        case E::Root_Surplus: return "Root: more roots than held";
        case E::Multiply_Missing: return "Multiply: required multiply not used";
        case E::Multiply_Surplus: return "Multiply: more multiplies than held";
        case E::Operator_Disabled: return "Operator: disabled operator used";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto op_char(OperatorKind o) -> char
    {
        switch (o)
        {
        case OperatorKind::Add: return '+';
        case OperatorKind::Subtract: return '-';
        case OperatorKind::Multiply: return '*';
        case OperatorKind::Divide: return '/';
        }
        return '?';
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.value) s += fmt::format(" | value={}", *v.value);
        if (v.discrepancy) s += fmt::format(" | by={}", *v.discrepancy);
        if (v.required) s += fmt::format(" | required={}", *v.required);
        if (v.used) s += fmt::format(" | used={}", *v.used);
        if (v.op) s += fmt::format(" | op={}", op_char(*v.op));
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    enum class EvalCode : std::uint8_t
    {
        EmptyExpression,
        Malformed, // operator count != term count - 1
        NegativeRoot,
        DivisionByZero,

        // defects in the evaluator itself, never a player error
        Internal_OperandUnderflow
    };

    struct EvalFault
    {
        EvalCode code{};
        std::string message;
    };

    inline auto to_string(EvalCode c) -> std::string_view
    {
        switch (c)
        {
        case EvalCode::EmptyExpression: return "empty expression";
        case EvalCode::Malformed: return "malformed expression";
        case EvalCode::NegativeRoot: return "negative argument to unary root";
        case EvalCode::DivisionByZero: return "division by zero";
        case EvalCode::Internal_OperandUnderflow: return "internal: operand stack underflow";
        }
        return "unknown evaluation error";
    }

    inline auto IsInternal(EvalCode c) noexcept -> bool
    {
        return c == EvalCode::Internal_OperandUnderflow;
    }

    // Reasons the card-by-card builder refuses a play.
    enum class BuildRejection : std::uint8_t
    {
        NumberNotExpected,
        OperatorNotExpected,
        CardIndexOutOfRange,
        CardAlreadyUsed,
        WrongSpecialKind,
        OperatorDisabled,
        NoNumbersLeft,
        RootAlreadyPending,
        NothingToUndo
    };

    inline auto to_string(BuildRejection r) -> std::string_view
    {
        using E = BuildRejection;
        switch (r)
        {
        case E::NumberNotExpected: return "Pick an operator card now.";
        case E::OperatorNotExpected: return "Pick a number card now.";
        case E::CardIndexOutOfRange: return "No such card in hand.";
        case E::CardAlreadyUsed: return "That card is already in the expression.";
        case E::WrongSpecialKind: return "That special card cannot be played that way.";
        case E::OperatorDisabled: return "That operator is disabled this round.";
        case E::NoNumbersLeft: return "No number cards left to follow it.";
        case E::RootAlreadyPending: return "A root is already waiting for a number.";
        case E::NothingToUndo: return "Nothing to undo.";
        }
        return "Unknown";
    }
}

#endif //MATHHIGHLOW_EXCEPTION_HPP
