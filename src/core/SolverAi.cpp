//
// Created by Malik T on 07/10/2025.
//

#include "SolverAi.hpp"

#include <utility>

#include "ClassicRules.hpp"
#include "Log.hpp"

namespace mhl::core
{
    static auto OrClassic(std::unique_ptr<Rules> rules) -> std::unique_ptr<Rules>
    {
        if (!rules) return std::make_unique<ClassicRules>();
        return rules;
    }

    SolverAI::SolverAI(std::unique_ptr<Rules> rules) :
        rules_(OrClassic(std::move(rules))),
        engine_(*rules_) {}

    auto SolverAI::Play(std::shared_ptr<const RoundSnapshot> snapshot) -> Expression
    {
        MHL_ASSERT(snapshot != nullptr, "SolverAI asked to play without a snapshot");
        Hand const& hand = snapshot->hand;

        used_fallback_ = false;
        last_ = engine_.Search(hand, snapshot->target);

        Rules::CheckResult const ok = rules_->Validate(hand, last_.expression);
        if (ok.has_value())
        {
            log::Info("AI", "`{}` (distance {:.3f}, {} candidates)",
                      last_.expression.ToDisplayString(), last_.distance, last_.stats.candidates);
            return last_.expression;
        }

        log::Warn("AI", "search result rejected: {}", error::describe(ok.error()));

        used_fallback_ = true;
        Expression fallback = SearchEngine::BuildFallback(hand);
        if (Rules::CheckResult const fb = rules_->Validate(hand, fallback); !fb.has_value())
        {
            log::Warn("AI", "fallback rejected: {}", error::describe(fb.error()));
        }
        return fallback;
    }
}
