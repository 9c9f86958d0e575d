//
// Created by Malik T on 09/10/2025.
//
#include "Game.hpp"

#include <algorithm>
#include <utility>

#include "Exception.hpp"
#include "Log.hpp"

namespace mhl::core
{
    GameImpl::GameImpl(Config const& config,
                       std::unique_ptr<Rules> rules,
                       std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        rules_(std::move(rules)),
        players_(std::move(players)),
        deck_(cfg_, cfg_.seed)
    {
        MHL_ASSERT(rules_ != nullptr, "Game constructed without rules");
        MHL_ASSERT(players_.size() == 2, "Game needs exactly one player and one AI");
        MHL_ASSERT(!std::ranges::any_of(players_,
                                        [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in core");
        if (cfg_.targets.empty()) MHL_THROW(error::Code::Config, "No targets configured");
        if (cfg_.min_bet < 0 || cfg_.min_bet > cfg_.max_bet)
            MHL_THROW(error::Code::Config, fmt::format("Bad bet range [{}, {}]", cfg_.min_bet, cfg_.max_bet));

        credits_.fill(cfg_.starting_credits);
        bet_ = cfg_.min_bet;
    }

    auto GameImpl::SetBet(int const bet) -> int
    {
        int const hi = std::max(cfg_.min_bet, std::min(cfg_.max_bet, credits_[Seat(Side::Player)]));
        bet_ = std::clamp(bet, cfg_.min_bet, hi);
        return bet_;
    }

    auto GameImpl::SetTargetIndex(size_t const idx) -> void
    {
        if (idx >= cfg_.targets.size())
            MHL_THROW(error::Code::State,
                      fmt::format("Target index {} out of range ({} targets)", idx, cfg_.targets.size()));
        target_index_ = idx;
    }

    auto GameImpl::DealHands() -> void
    {
        // player first, same pile
        DealHand(deck_, hands_[Seat(Side::Player)], cfg_);
        DealHand(deck_, hands_[Seat(Side::AI)], cfg_);
    }

    auto GameImpl::SnapshotFor(Side const s) const -> std::shared_ptr<RoundSnapshot const>
    {
        std::shared_ptr<RoundSnapshot> snap = std::make_shared<RoundSnapshot>();
        snap->side = s;
        snap->hand = hands_[Seat(s)];
        snap->target = Target();
        snap->round = round_;
        snap->bet = bet_;
        snap->my_credits = credits_[Seat(s)];
        snap->opponent_credits = credits_[1 - Seat(s)];
        return snap;
    }

    auto GameImpl::ReportViolation(Side const s, SideResult const& r) const -> void
    {
        if (r.Valid()) return;
        std::string_view const who = s == Side::Player ? "Player" : "AI";
        if (r.violation.has_value())
            log::Warn("Rules", "{}: {}", who, error::describe(*r.violation));
        else
            log::Warn("Rules", "{}: {}", who, r.error);
    }

    auto GameImpl::PlayRound() -> RoundResult
    {
        if (IsOver()) MHL_THROW(error::Code::State, "PlayRound called after the game ended");

        ++round_;
        SetBet(bet_);
        DealHands();

        log::Info("Game", "round {} target {} bet {}", round_, Target(), bet_);

        Expression const player_expr = players_[Seat(Side::Player)]->Play(SnapshotFor(Side::Player));
        Expression const ai_expr = players_[Seat(Side::AI)]->Play(SnapshotFor(Side::AI));

        RoundResult result = ScoreRound(RoundInputs{
            .rules = *rules_,
            .player_hand = hands_[Seat(Side::Player)],
            .ai_hand = hands_[Seat(Side::AI)],
            .player_expr = player_expr,
            .ai_expr = ai_expr,
            .target = Target(),
            .bet = bet_,
            .round = round_
        });

        ReportViolation(Side::Player, result.player);
        ReportViolation(Side::AI, result.ai);

        credits_[Seat(Side::Player)] += result.player_delta;
        credits_[Seat(Side::AI)] += result.ai_delta;

        log::Info("Game", "{} | credits player {} ai {}", Summary(result),
                  credits_[Seat(Side::Player)], credits_[Seat(Side::AI)]);
        return result;
    }

    auto GameImpl::IsOver() const noexcept -> bool
    {
        return credits_[Seat(Side::Player)] <= 0 || credits_[Seat(Side::AI)] <= 0;
    }

    auto GameImpl::Winner() const -> std::optional<Side>
    {
        if (!IsOver()) return std::nullopt;
        if (credits_[Seat(Side::Player)] <= 0) return Side::AI;
        return Side::Player;
    }
}
