//
// Created by Malik T on 06/10/2025.
//

#ifndef MATHHIGHLOW_SEARCHENGINE_HPP
#define MATHHIGHLOW_SEARCHENGINE_HPP

#include <cstddef>
#include <limits>

#include "Expression.hpp"
#include "Hand.hpp"
#include "Rules.hpp"

namespace mhl::core
{
    struct SearchStats
    {
        size_t candidates{};        // complete candidates built
        size_t rejected_rules{};    // failed validation (construction should prevent this)
        size_t rejected_eval{};     // division by zero, negative root
        size_t internal_faults{};   // evaluator defects, logged separately
    };

    struct SearchResult
    {
        Expression expression;
        double distance{std::numeric_limits<double>::infinity()};
        bool prioritized{false};    // true if the special-usage candidate was returned
        SearchStats stats{};
    };

    // Exhaustive constrained search for the expression closest to a target:
    //   distinct number permutations x root placements x operator assignments.
    // All per-call state lives in the call; the engine itself is immutable.
    class SearchEngine
    {
    public:
        explicit SearchEngine(Rules const& rules) : rules_(rules) {}

        auto Search(Hand const& hand, int target) const -> SearchResult;

        auto FindBestExpression(Hand const& hand, int target) const -> Expression
        {
            return Search(hand, target).expression;
        }

        // Deterministic construction used when the search result does not validate.
        // Not guaranteed to validate itself on degenerate hands.
        static auto BuildFallback(Hand const& hand) -> Expression;

    private:
        Rules const& rules_;
    };
}

#endif //MATHHIGHLOW_SEARCHENGINE_HPP
