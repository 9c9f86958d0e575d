//
// Created by Malik T on 08/10/2025.
//

#ifndef MATHHIGHLOW_DECK_HPP
#define MATHHIGHLOW_DECK_HPP

#include <cstdint>
#include <random>
#include <vector>

#include "Hand.hpp"
#include "Types.hpp"

namespace mhl::core
{
    // Shuffled slot deck of number and special cards. Operator cards are not drawn;
    // every hand receives the base set when dealt.
    class Deck
    {
    public:
        Deck(Config const& config, uint64_t seed);

        // Refills the pile from the config and shuffles it.
        auto Build() -> void;

        // Takes the top card, rebuilding first if the pile ran out. The result is a fresh clone.
        auto Draw() -> Card;

        // Uniform number card independent of the pile.
        auto DrawRandomNumber() -> NumberCard;

        auto Remaining() const noexcept -> size_t { return cards_.size(); }
        auto Rebuilds() const noexcept -> uint32_t { return rebuilds_; }

    private:
        Config cfg_;
        std::mt19937_64 rng_;
        std::vector<Card> cards_;
        uint32_t rebuilds_{};
    };

    // Clears hand, gives the base operators (+ - ÷), draws config.initial_card_count cards,
    // then draws until the hand holds config.number_cards_per_hand numbers.
    auto DealHand(Deck& deck, Hand& hand, Config const& config) -> void;
}

#endif //MATHHIGHLOW_DECK_HPP
