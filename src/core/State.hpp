//
// Created by Malik T on 07/10/2025.
//

#ifndef MATHHIGHLOW_STATE_HPP
#define MATHHIGHLOW_STATE_HPP

#include <cstdint>

#include "Hand.hpp"
#include "Types.hpp"

namespace mhl::core
{
    // Immutable per-side view of a round handed to a Player (owning copy of the hand)
    struct RoundSnapshot
    {
        Side     side{Side::Player};
        Hand     hand;
        int      target{};
        uint32_t round{};
        int      bet{};

        int      my_credits{};
        int      opponent_credits{};
    };
} // namespace mhl::core

#endif //MATHHIGHLOW_STATE_HPP
