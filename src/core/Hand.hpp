//
// Created by Malik T on 03/10/2025.
//

#ifndef MATHHIGHLOW_HAND_HPP
#define MATHHIGHLOW_HAND_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "Types.hpp"

namespace mhl::core
{
    // Cards held by one side for one round. Built fresh each round by the dealer,
    // read-only once handed to the search engine.
    class Hand
    {
    public:
        auto Clear() -> void;

        auto AddCard(Card const& c) -> void;

        // Removes one card equal to c. Returns false if none is held.
        auto RemoveCard(Card const& c) -> bool;

        auto Numbers() const noexcept -> std::vector<NumberCard> const& { return numbers_; }
        auto Operators() const noexcept -> std::vector<OperatorCard> const& { return operators_; }
        auto Specials() const noexcept -> std::vector<SpecialCard> const& { return specials_; }
        auto SpecialAt(size_t idx) -> SpecialCard& { return specials_.at(idx); }

        // Number of forced multiply specials (M).
        [[nodiscard]] auto MultiplyCount() const -> int;
        // Number of unary root specials (S).
        [[nodiscard]] auto RootCount() const -> int;

        [[nodiscard]] auto IsOperatorEnabled(OperatorKind op) const -> bool;
        auto DisableOperator(OperatorKind op) -> void;
        auto DisabledOperators() const noexcept -> std::vector<OperatorKind> const& { return disabled_; }

        // Distinct enabled kinds among the held operator cards.
        [[nodiscard]] auto AvailableOperators() const -> std::vector<OperatorKind>;
        // Enabled operator cards as a multiset, in held order; each entry is one card.
        [[nodiscard]] auto UsableOperatorCards() const -> std::vector<OperatorKind>;

        [[nodiscard]] auto NumberValues() const -> std::vector<int>;

        [[nodiscard]] auto TotalCardCount() const noexcept -> size_t;
        [[nodiscard]] auto IsEmpty() const noexcept -> bool;

        auto ResetSpecialUsage() -> void;

        [[nodiscard]] auto Summary() const -> std::string;

    private:
        std::vector<NumberCard> numbers_;
        std::vector<OperatorCard> operators_;
        std::vector<SpecialCard> specials_;
        std::vector<OperatorKind> disabled_;
    };
}

#endif //MATHHIGHLOW_HAND_HPP
