//
// Created by Malik T on 08/10/2025.
//

#include "Deck.hpp"

#include <algorithm>
#include <utility>

#include "Card.hpp"
#include "Exception.hpp"
#include "Log.hpp"

namespace mhl::core
{
    Deck::Deck(Config const& config, uint64_t const seed) :
        cfg_(config),
        rng_{seed}
    {
        Build();
    }

    auto Deck::Build() -> void
    {
        cards_.clear();
        for (int v = constants::MinNumberValue; v <= constants::MaxNumberValue; ++v)
        {
            for (size_t i{}; i < cfg_.number_copies_per_value; ++i)
                cards_.emplace_back(NumberCard{v});
        }
        for (size_t i{}; i < cfg_.multiply_cards_per_deck; ++i)
            cards_.emplace_back(SpecialCard{SpecialKind::ForcedMultiply});
        for (size_t i{}; i < cfg_.root_cards_per_deck; ++i)
            cards_.emplace_back(SpecialCard{SpecialKind::UnaryRoot});

        std::ranges::shuffle(cards_, rng_);
    }

    auto Deck::Draw() -> Card
    {
        if (cards_.empty())
        {
            Build();
            ++rebuilds_;
            log::Info("Deck", "pile exhausted, rebuilt {} cards", cards_.size());
        }
        if (cards_.empty()) MHL_THROW(error::Code::Deck, "Deck config yields no cards to draw");

        Card top = std::move(cards_.back());
        cards_.pop_back();
        return Clone(top);
    }

    auto Deck::DrawRandomNumber() -> NumberCard
    {
        std::uniform_int_distribution<int> dist{constants::MinNumberValue, constants::MaxNumberValue};
        return NumberCard{dist(rng_)};
    }

    auto DealHand(Deck& deck, Hand& hand, Config const& config) -> void
    {
        if (config.number_cards_per_hand > 0 && config.number_copies_per_value == 0)
            MHL_THROW(error::Code::Config, "Hands need number cards but the deck holds none");

        hand.Clear();
        hand.AddCard(OperatorCard{OperatorKind::Add});
        hand.AddCard(OperatorCard{OperatorKind::Subtract});
        hand.AddCard(OperatorCard{OperatorKind::Divide});

        for (size_t i{}; i < config.initial_card_count; ++i)
            hand.AddCard(deck.Draw());

        while (hand.Numbers().size() < config.number_cards_per_hand)
            hand.AddCard(deck.Draw());

        log::Info("Deck", "dealt {}", hand.Summary());
    }
}
