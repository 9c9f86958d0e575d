//
// Created by Malik T on 02/10/2025.
//

#ifndef MATHHIGHLOW_TYPES_HPP
#define MATHHIGHLOW_TYPES_HPP

#define MHL_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <random>
#include <variant>
#include <vector>

namespace mhl::core::constants
{
    inline constexpr int MinNumberValue = 0;
    inline constexpr int MaxNumberValue = 10;
    // |divisor| below this is treated as zero
    inline constexpr double DivideEpsilon = 1e-6;
    // distances closer than this score as a draw
    inline constexpr double DrawEpsilon = 1e-5;
}

namespace mhl::core
{
    enum class OperatorKind : uint8_t
    {
        Add = 0,
        Subtract,
        Multiply,
        Divide
    };

    enum class SpecialKind : uint8_t
    {
        ForcedMultiply = 0,
        UnaryRoot
    };

    // The deck deals values in [MinNumberValue, MaxNumberValue]; the engine accepts any integer.
    struct NumberCard
    {
        int value{};
    };

    struct OperatorCard
    {
        OperatorKind op;
    };

    struct SpecialCard
    {
        SpecialKind kind;
        bool consumed{false};
    };

    inline auto operator==(NumberCard const& a, NumberCard const& b) -> bool { return a.value == b.value; }
    inline auto operator==(OperatorCard const& a, OperatorCard const& b) -> bool { return a.op == b.op; }
    // usage state is not part of a special card's identity
    inline auto operator==(SpecialCard const& a, SpecialCard const& b) -> bool { return a.kind == b.kind; }

    using Card = std::variant<NumberCard, OperatorCard, SpecialCard>;

    enum class Side : uint8_t
    {
        Player = 0,
        AI
    };

    struct Config
    {
        // dealing
        uint8_t  initial_card_count{3};
        uint8_t  number_cards_per_hand{3};
        uint8_t  number_copies_per_value{4};
        uint8_t  multiply_cards_per_deck{2};
        uint8_t  root_cards_per_deck{2};

        // credits and betting
        int      starting_credits{20};
        int      min_bet{1};
        int      max_bet{5};
        std::vector<int> targets{1, 20};

        uint64_t seed{std::random_device{}()};

        static auto Easy() -> Config
        {
            Config c{};
            c.starting_credits = 30;
            c.targets = {5, 10};
            return c;
        }

        static auto Hard() -> Config
        {
            Config c{};
            c.starting_credits = 15;
            c.min_bet = 2;
            c.max_bet = 10;
            c.targets = {1, 50, 100};
            return c;
        }
    };
}

#endif //MATHHIGHLOW_TYPES_HPP
