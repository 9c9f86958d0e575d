//
// Created by Malik T on 09/10/2025.
//

#ifndef MATHHIGHLOW_GAME_HPP
#define MATHHIGHLOW_GAME_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "Deck.hpp"
#include "Hand.hpp"
#include "Player.hpp"
#include "Rules.hpp"
#include "Scoring.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace mhl::core
{
    // Authoritative round loop for one player against one AI.
    class GameImpl
    {
    public:
        GameImpl() = delete;
        // players[0] is Side::Player, players[1] is Side::AI
        GameImpl(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<std::unique_ptr<Player>> players);

        // Clamps to [min_bet, min(max_bet, player credits)] and returns the applied bet.
        auto SetBet(int bet) -> int;
        auto Bet() const noexcept -> int { return bet_; }

        // Throws StateError when idx is outside config.targets.
        auto SetTargetIndex(size_t idx) -> void;
        auto Target() const -> int { return cfg_.targets.at(target_index_); }
        auto Targets() const noexcept -> std::vector<int> const& { return cfg_.targets; }

        // Deal, ask both sides, score, settle credits.
        auto PlayRound() -> RoundResult;

        auto IsOver() const noexcept -> bool;
        // Side left standing once the game is over
        auto Winner() const -> std::optional<Side>;

        auto Credits(Side s) const -> int { return credits_[Seat(s)]; }
        auto RoundsPlayed() const noexcept -> uint32_t { return round_; }
        auto HandOf(Side s) const -> Hand const& { return hands_[Seat(s)]; }
        auto SnapshotFor(Side s) const -> std::shared_ptr<RoundSnapshot const>;
        auto PlayerAt(Side s) -> Player* { return players_[Seat(s)].get(); }

    private:
        static constexpr auto Seat(Side s) -> size_t { return s == Side::Player ? 0 : 1; }

        auto DealHands() -> void;
        auto ReportViolation(Side s, SideResult const& r) const -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<std::unique_ptr<Player>> players_;
        Deck deck_;

        // Authoritative state
        std::array<Hand, 2> hands_{};
        std::array<int, 2> credits_{};

        // Round state
        int bet_{};
        size_t target_index_{0};
        uint32_t round_{0};
    };
}
#endif //MATHHIGHLOW_GAME_HPP
