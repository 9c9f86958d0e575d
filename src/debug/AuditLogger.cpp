#include "AuditLogger.hpp"

#include <string_view>

#include <fmt/format.h>

using namespace mhl::core;

namespace
{

auto s_expr(SideResult const& s) -> std::string
{
    if (s.expression.IsEmpty()) return "<empty>";
    return s.expression.ToDisplayString();
}

auto s_value(SideResult const& s) -> std::string
{
    if (!s.Valid()) return fmt::format("invalid ({})", s.error);
    return fmt::format("{:.4f} distance={:.4f}", *s.value, s.distance);
}

auto serialize_targets(std::vector<int> const& targets) -> std::string
{
    std::string serial;
    for (size_t i{}; i < targets.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += fmt::format("{}", targets[i]);
    }
    return serial;
}

} // anonymous namespace

namespace mhl::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameImpl const& game, uint64_t seed) -> void
{
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Credits=Player:{},AI:{}\n", game.Credits(Side::Player), game.Credits(Side::AI));
    out_ << fmt::format("Targets=[{}] active={}\n", serialize_targets(game.Targets()), game.Target());
    out_.flush();
}

auto AuditLogger::round(GameImpl const& game, RoundResult const& r) -> void
{
    out_ << fmt::format("Round {} target={} bet={}\n", r.round, r.target, r.bet);
    out_ << fmt::format("  PlayerHand: {}\n", game.HandOf(Side::Player).Summary());
    out_ << fmt::format("  AIHand:     {}\n", game.HandOf(Side::AI).Summary());
    out_ << fmt::format("  Player: {} -> {}\n", s_expr(r.player), s_value(r.player));
    out_ << fmt::format("  AI:     {} -> {}\n", s_expr(r.ai), s_value(r.ai));
    out_ << fmt::format("  Winner: {} credits=Player:{},AI:{}\n",
                        to_string(r.winner), game.Credits(Side::Player), game.Credits(Side::AI));
}

auto AuditLogger::end(GameImpl const& game) -> void
{
    std::string_view winner = "None";
    if (auto const w = game.Winner(); w.has_value())
        winner = (*w == Side::Player) ? "Player" : "AI";

    out_ << fmt::format("Rounds={}\n", game.RoundsPlayed());
    out_ << fmt::format("Winner={}\n", winner);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

}
