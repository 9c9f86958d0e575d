//
// Created by Malik T on 06/10/2025.
//

#include "SearchEngine.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include "Card.hpp"
#include "Evaluator.hpp"
#include "Log.hpp"

namespace mhl::core
{
    namespace
    {
        struct SearchContext
        {
            SearchContext(Rules const& r, Hand const& h, int const t) : rules(r), hand(h), target(t) {}

            Rules const& rules;
            Hand const& hand;
            int target{};
            int roots_required{};     // S
            int multiply_required{};  // M
            bool prioritize{false};   // S > 0 || M > 0
            size_t slots{};

            // distinct values in first-seen order with their held count,
            // so equal values never open duplicate branches
            std::vector<std::pair<int, int>> distinct;
            std::vector<int> taken;
            std::vector<int> permutation;

            std::vector<bool> roots;

            std::vector<OperatorKind> pool;   // unused operator cards
            std::vector<OperatorKind> operators;

            double best_distance{std::numeric_limits<double>::infinity()};
            Expression best;
            double prioritized_distance{std::numeric_limits<double>::infinity()};
            std::optional<Expression> prioritized;

            SearchStats stats{};
        };

        auto UsesAllRequiredSpecials(SearchContext const& ctx, Expression const& expr) -> bool
        {
            return expr.RootCount() == ctx.roots_required && expr.MultiplyCount() == ctx.multiply_required;
        }

        auto Consider(SearchContext& ctx) -> void
        {
            Expression expr;
            for (size_t i{}; i < ctx.permutation.size(); ++i)
            {
                expr.AddNumber(ctx.permutation[i], ctx.roots[i]);
                if (i < ctx.operators.size()) expr.AddOperator(ctx.operators[i]);
            }
            ++ctx.stats.candidates;

            if (!ctx.rules.Validate(ctx.hand, expr).has_value())
            {
                ++ctx.stats.rejected_rules;
                return;
            }

            EvaluationResult const value = Evaluate(expr);
            if (!value.has_value())
            {
                if (error::IsInternal(value.error().code))
                {
                    ++ctx.stats.internal_faults;
                    log::Warn("Search", "internal fault: {} in `{}`", value.error().message, expr.ToDisplayString());
                }
                else
                {
                    ++ctx.stats.rejected_eval;
                }
                return;
            }

            double const distance = std::fabs(*value - static_cast<double>(ctx.target));

            // strict < : first found wins ties
            if (ctx.prioritize && UsesAllRequiredSpecials(ctx, expr) && distance < ctx.prioritized_distance)
            {
                ctx.prioritized_distance = distance;
                ctx.prioritized = expr;
            }

            if (distance < ctx.best_distance)
            {
                ctx.best_distance = distance;
                ctx.best = expr;
            }
        }

        // stage 3
        auto AssignOperators(SearchContext& ctx, size_t const gap, int const multiply_used) -> void
        {
            size_t const gaps_left = ctx.slots - gap;
            int const multiply_left = ctx.multiply_required - multiply_used;

            if (multiply_left > static_cast<int>(gaps_left)) return;

            if (gap == ctx.slots)
            {
                if (multiply_used == ctx.multiply_required) Consider(ctx);
                return;
            }

            if (multiply_used < ctx.multiply_required)
            {
                ctx.operators.push_back(OperatorKind::Multiply);
                AssignOperators(ctx, gap + 1, multiply_used + 1);
                ctx.operators.pop_back();
            }

            for (size_t i{}; i < ctx.pool.size(); ++i)
            {
                OperatorKind const op = ctx.pool[i];
                ctx.pool.erase(ctx.pool.begin() + static_cast<std::ptrdiff_t>(i));
                ctx.operators.push_back(op);

                AssignOperators(ctx, gap + 1, multiply_used);

                ctx.operators.pop_back();
                ctx.pool.insert(ctx.pool.begin() + static_cast<std::ptrdiff_t>(i), op);
            }
        }

        // stage 2
        auto PlaceRoots(SearchContext& ctx, size_t const index, int const placed) -> void
        {
            size_t const count = ctx.permutation.size();
            if (index == count)
            {
                if (placed == ctx.roots_required) AssignOperators(ctx, 0, 0);
                return;
            }

            int const remaining = ctx.roots_required - placed;
            int const positions_left = static_cast<int>(count - index);

            int const hi = std::min(1, remaining);
            int const lo = std::max(0, remaining - (positions_left - 1));
            if (lo > hi) return;

            for (int n = hi; n >= lo; --n)
            {
                ctx.roots.push_back(n > 0);
                PlaceRoots(ctx, index + 1, placed + n);
                ctx.roots.pop_back();
            }
        }

        // stage 1
        auto PermuteNumbers(SearchContext& ctx) -> void
        {
            if (ctx.permutation.size() == ctx.hand.Numbers().size())
            {
                PlaceRoots(ctx, 0, 0);
                return;
            }

            for (size_t d{}; d < ctx.distinct.size(); ++d)
            {
                auto const [value, held] = ctx.distinct[d];
                if (ctx.taken[d] >= held) continue;

                ++ctx.taken[d];
                ctx.permutation.push_back(value);

                PermuteNumbers(ctx);

                ctx.permutation.pop_back();
                --ctx.taken[d];
            }
        }

        auto DistinctInOrder(std::vector<int> const& values) -> std::vector<std::pair<int, int>>
        {
            std::vector<std::pair<int, int>> out;
            for (int const v : values)
            {
                auto const it = std::ranges::find_if(out, [v](auto const& p) { return p.first == v; });
                if (it == out.end()) out.emplace_back(v, 1);
                else ++it->second;
            }
            return out;
        }
    }

    auto SearchEngine::Search(Hand const& hand, int const target) const -> SearchResult
    {
        SearchContext ctx(rules_, hand, target);
        ctx.roots_required = hand.RootCount();
        ctx.multiply_required = hand.MultiplyCount();
        ctx.prioritize = ctx.roots_required > 0 || ctx.multiply_required > 0;
        ctx.pool = hand.UsableOperatorCards();

        size_t const numbers = hand.Numbers().size();
        if (numbers == 0) return SearchResult{};

        ctx.slots = numbers - 1;
        if (ctx.multiply_required > static_cast<int>(ctx.slots))
            return SearchResult{};
        if (ctx.slots - static_cast<size_t>(ctx.multiply_required) > ctx.pool.size())
            return SearchResult{};

        ctx.distinct = DistinctInOrder(hand.NumberValues());
        ctx.taken.assign(ctx.distinct.size(), 0);
        ctx.permutation.reserve(numbers);
        ctx.roots.reserve(numbers);
        ctx.operators.reserve(ctx.slots);

        PermuteNumbers(ctx);

        SearchResult out{};
        out.stats = ctx.stats;
        if (ctx.prioritize && ctx.prioritized.has_value())
        {
            out.expression = *ctx.prioritized;
            out.distance = ctx.prioritized_distance;
            out.prioritized = true;
        }
        else
        {
            out.expression = ctx.best;
            out.distance = ctx.best_distance;
        }

        log::Info("Search", "{} candidates, best `{}` distance {:.3f}",
                  out.stats.candidates, out.expression.ToDisplayString(), out.distance);
        return out;
    }

    auto SearchEngine::BuildFallback(Hand const& hand) -> Expression
    {
        Expression fallback;

        std::vector<int> const numbers = hand.NumberValues();
        if (numbers.empty()) return fallback;

        int roots_left = hand.RootCount();
        int multiply_left = std::min(hand.MultiplyCount(), static_cast<int>(numbers.size()) - 1);

        std::deque<OperatorKind> queue;
        for (OperatorCard const& c : hand.Operators()) queue.push_back(c.op);

        for (size_t i{}; i < numbers.size(); ++i)
        {
            bool const root = roots_left > 0;
            if (root) --roots_left;
            fallback.AddNumber(numbers[i], root);

            if (i + 1 == numbers.size()) break;

            if (multiply_left > 0)
            {
                fallback.AddOperator(OperatorKind::Multiply);
                --multiply_left;
            }
            else if (!queue.empty())
            {
                fallback.AddOperator(queue.front());
                queue.pop_front();
            }
            else
            {
                fallback.AddOperator(OperatorKind::Add);
            }
        }
        return fallback;
    }
}
