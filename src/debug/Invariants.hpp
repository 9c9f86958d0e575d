//
// Created by Malik T on 10/10/2025.
//

#ifndef MATHHIGHLOW_INVARIANTS_HPP
#define MATHHIGHLOW_INVARIANTS_HPP

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../core/SearchEngine.hpp"
#include <cassert>
#include <cmath>

namespace mhl::core::debug
{
    // Search output must either be empty or use every number once and exactly S roots / M multiplies
    inline auto CheckSearchResult(Hand const& hand, SearchResult const& r) -> void
    {
#if MHL_ENABLE_TEST_HOOKS == false
        (void)hand;
        (void)r;
#else
        if (r.expression.IsEmpty())
        {
            assert(std::isinf(r.distance) && "Empty search result with finite distance");
            return;
        }

        // 1) Structure
        assert(r.expression.IsComplete() && "Search returned an incomplete expression");
        assert(r.expression.Terms().size() == hand.Numbers().size() && "Search did not use every number");

        // 2) A prioritized result uses all specials
        if (r.prioritized)
        {
            assert(r.expression.RootCount() == hand.RootCount());
            assert(r.expression.MultiplyCount() == hand.MultiplyCount());
        }

        // 3) Rules agree with the engine
        ClassicRules const rules{};
        assert(rules.Validate(hand, r.expression).has_value() && "Search result does not validate");
        assert(r.stats.internal_faults == 0 && "Evaluator reported an internal fault during search");
#endif // MHL_ENABLE_TEST_HOOKS == true
    }

    // Credits move between the two sides only
    inline auto CheckCredits(GameImpl const& g, Config const& cfg) -> void
    {
#if MHL_ENABLE_TEST_HOOKS == false
        (void)g;
        (void)cfg;
#else
        int const total = g.Credits(Side::Player) + g.Credits(Side::AI);
        assert(total == 2 * cfg.starting_credits && "Credits are not zero-sum");
        assert(g.Bet() >= cfg.min_bet && g.Bet() <= cfg.max_bet && "Bet outside configured range");
#endif // MHL_ENABLE_TEST_HOOKS == true
    }
}
#endif //MATHHIGHLOW_INVARIANTS_HPP
