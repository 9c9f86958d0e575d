//
// Created by Malik T on 11/10/2025.
//

// Console match: one human (or --auto solver) against the solver AI.

#include <charconv>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "core/Card.hpp"
#include "core/ClassicRules.hpp"
#include "core/Exception.hpp"
#include "core/ExpressionBuilder.hpp"
#include "core/Game.hpp"
#include "core/Log.hpp"
#include "core/SolverAi.hpp"
#include "debug/AuditLogger.hpp"

namespace
{
    using namespace mhl::core;

    struct ConsoleConfig
    {
        Config        game{};
        std::uint32_t rounds{0};       // 0 = until a side runs out of credits
        std::size_t   target_index{0};
        int           bet{1};
        bool          auto_player{false};
        bool          quiet{false};
        std::string   log_path{};
    };

    auto PrintUsage() -> void
    {
        fmt::print("usage: mhl_console [--seed N] [--rounds N] [--target-index N] [--bet N]\n"
                   "                   [--preset easy|hard] [--log PATH] [--auto] [--quiet]\n");
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<ConsoleConfig>
    {
        ConsoleConfig cfg{};
        std::optional<std::uint64_t> seed;
        std::optional<int> bet;

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };
            auto next_str = [&](std::string& out)
            {
                if (i + 1 >= argc) { return false; }
                out = argv[++i];
                return true;
            };

            std::uint64_t v{};
            if (arg == "--seed")
            {
                if (!next_uint(v)) return std::nullopt;
                seed = v;
            }
            else if (arg == "--rounds")
            {
                if (!next_uint(v)) return std::nullopt;
                cfg.rounds = static_cast<std::uint32_t>(v);
            }
            else if (arg == "--target-index")
            {
                if (!next_uint(v)) return std::nullopt;
                cfg.target_index = static_cast<std::size_t>(v);
            }
            else if (arg == "--bet")
            {
                if (!next_uint(v)) return std::nullopt;
                bet = static_cast<int>(v);
            }
            else if (arg == "--preset")
            {
                std::string p;
                if (!next_str(p)) return std::nullopt;
                if (p == "easy") cfg.game = Config::Easy();
                else if (p == "hard") cfg.game = Config::Hard();
                else return std::nullopt;
            }
            else if (arg == "--log")
            {
                if (!next_str(cfg.log_path)) return std::nullopt;
            }
            else if (arg == "--auto")
            {
                cfg.auto_player = true;
            }
            else if (arg == "--quiet")
            {
                cfg.quiet = true;
            }
            else
            {
                return std::nullopt;
            }
        }

        // presets replace the whole config, so apply the overrides last
        if (seed.has_value()) cfg.game.seed = *seed;
        cfg.bet = bet.value_or(cfg.game.min_bet);
        return cfg;
    }

    auto ShowHand(ExpressionBuilder const& b) -> void
    {
        Hand const& h = b.HandView();
        std::string line;
        for (std::size_t i{}; i < h.Numbers().size(); ++i)
            line += fmt::format(" n{}={}{}", i, h.Numbers()[i].value, b.IsNumberUsed(i) ? "*" : "");
        for (std::size_t i{}; i < h.Operators().size(); ++i)
        {
            OperatorKind const op = h.Operators()[i].op;
            line += fmt::format(" o{}={}{}{}", i, Symbol(op),
                                h.IsOperatorEnabled(op) ? "" : "(off)", b.IsOperatorUsed(i) ? "*" : "");
        }
        for (std::size_t i{}; i < h.Specials().size(); ++i)
            line += fmt::format(" s{}={}{}", i, Symbol(h.Specials()[i].kind), b.IsSpecialUsed(i) ? "*" : "");
        fmt::print("Hand:{}\n", line);
        fmt::print("Expr: {}{}\n", b.Current().ToDisplayString(), b.RootPending() ? " √_" : "");
    }

    // Reads n<i>, o<i>, s<i>, undo, reset, submit from stdin
    class ConsolePlayer final : public Player
    {
    public:
        auto Play(std::shared_ptr<const RoundSnapshot> snap) -> Expression override
        {
            fmt::print("\nRound {} | target {} | bet {} | credits you {} ai {}\n",
                       snap->round, snap->target, snap->bet, snap->my_credits, snap->opponent_credits);
            fmt::print("Commands: n<i> o<i> s<i> undo reset submit\n");

            ExpressionBuilder b{snap->hand};
            std::string line;
            while (true)
            {
                ShowHand(b);
                fmt::print("> ");
                std::cout.flush();
                if (!std::getline(std::cin, line)) return b.Current();

                if (line == "submit")
                {
                    if (b.NeedsSpecialReminder())
                        fmt::print("Reminder: every special card in your hand must be used.\n");
                    return b.Current();
                }

                ExpressionBuilder::StepResult r{};
                if (line == "undo") r = b.Undo();
                else if (line == "reset") b.Reset();
                else if (auto idx = Index(line); idx.has_value() && line[0] == 'n') r = b.PlayNumber(*idx);
                else if (idx.has_value() && line[0] == 'o') r = b.PlayOperator(*idx);
                else if (idx.has_value() && line[0] == 's') r = PlaySpecial(b, *idx);
                else
                {
                    fmt::print("Unknown command `{}`\n", line);
                    continue;
                }

                if (!r.has_value()) fmt::print("{}\n", error::to_string(r.error()));
            }
        }

    private:
        static auto Index(std::string const& tok) -> std::optional<std::size_t>
        {
            if (tok.size() < 2) return std::nullopt;
            std::size_t out{};
            auto const res = std::from_chars(tok.data() + 1, tok.data() + tok.size(), out);
            if (res.ec != std::errc{} || res.ptr != tok.data() + tok.size()) return std::nullopt;
            return out;
        }

        static auto PlaySpecial(ExpressionBuilder& b, std::size_t idx) -> ExpressionBuilder::StepResult
        {
            if (idx >= b.HandView().Specials().size())
                return std::unexpected(error::BuildRejection::CardIndexOutOfRange);
            if (b.HandView().Specials()[idx].kind == SpecialKind::UnaryRoot) return b.PlayRoot(idx);
            return b.PlayForcedMultiply(idx);
        }
    };
}

int main(int argc, char** argv)
{
    using namespace mhl::core;

    std::optional<ConsoleConfig> const parsed = ParseArgs(argc, argv);
    if (!parsed.has_value())
    {
        PrintUsage();
        return 2;
    }
    ConsoleConfig const& cc = *parsed;
    if (cc.quiet) log::SetLevel(log::Level::Warn);

    try
    {
        std::vector<std::unique_ptr<Player>> players;
        if (cc.auto_player) players.emplace_back(std::make_unique<SolverAI>());
        else players.emplace_back(std::make_unique<ConsolePlayer>());
        players.emplace_back(std::make_unique<SolverAI>());

        GameImpl game(cc.game, std::make_unique<ClassicRules>(), std::move(players));
        game.SetTargetIndex(cc.target_index);
        int const applied = game.SetBet(cc.bet);
        if (applied != cc.bet) log::Warn("Game", "bet {} clamped to {}", cc.bet, applied);

        std::optional<debug::AuditLogger> audit;
        if (!cc.log_path.empty())
        {
            audit.emplace(cc.log_path);
            if (!audit->IsOpen())
            {
                log::Warn("Game", "cannot open transcript `{}`", cc.log_path);
                audit.reset();
            }
        }
        if (audit) audit->start(game, cc.game.seed);

        fmt::print("MathHighLow | seed {} | target {} | credits {}\n",
                   cc.game.seed, game.Target(), game.Credits(Side::Player));

        while (!game.IsOver() && (cc.rounds == 0 || game.RoundsPlayed() < cc.rounds))
        {
            RoundResult const r = game.PlayRound();
            if (!cc.auto_player && !r.player.Valid()) fmt::print("{}\n", error::GeneralFailureMessage);
            fmt::print("{}\n", Detail(r));
            if (audit) audit->round(game, r);
        }

        if (audit) audit->end(game);

        std::optional<Side> const w = game.Winner();
        if (!w.has_value())
            fmt::print("Stopped after {} rounds. Credits you {} ai {}\n",
                       game.RoundsPlayed(), game.Credits(Side::Player), game.Credits(Side::AI));
        else
            fmt::print("{} wins after {} rounds.\n", *w == Side::Player ? "Player" : "AI", game.RoundsPlayed());
    }
    catch (OmegaException<error::Code> const& e)
    {
        fmt::print(stderr, "{}\n", e);
        return 1;
    }

    return 0;
}
