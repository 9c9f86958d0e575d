//
// Created by Malik T on 07/10/2025.
//

#ifndef MATHHIGHLOW_PLAYER_HPP
#define MATHHIGHLOW_PLAYER_HPP

#include <memory>

#include "Expression.hpp"
#include "State.hpp"

namespace mhl::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called once per round by the game loop (console human, solver AI or a test double).
        // The returned expression is validated and scored by the caller.
        virtual auto Play(std::shared_ptr<const RoundSnapshot> snapshot) -> Expression = 0;
    };
}
#endif //MATHHIGHLOW_PLAYER_HPP
