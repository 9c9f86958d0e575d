//
// Created by Malik T on 07/10/2025.
//

#ifndef MATHHIGHLOW_SOLVERAI_HPP
#define MATHHIGHLOW_SOLVERAI_HPP

#include <memory>

#include "Player.hpp"
#include "Rules.hpp"
#include "SearchEngine.hpp"
#include "State.hpp"

namespace mhl::core
{
    class SolverAI final : public mhl::core::Player
    {
    public:
        // nullptr rules -> ClassicRules
        explicit SolverAI(std::unique_ptr<Rules> rules = nullptr);

        auto Play(std::shared_ptr<const mhl::core::RoundSnapshot> snapshot) -> mhl::core::Expression override;

        auto LastSearch() const noexcept -> SearchResult const& { return last_; }
        auto UsedFallback() const noexcept -> bool { return used_fallback_; }

    private:
        std::unique_ptr<Rules> rules_;
        SearchEngine engine_;

        SearchResult last_{};
        bool used_fallback_{false};
    };
}

#endif //MATHHIGHLOW_SOLVERAI_HPP
