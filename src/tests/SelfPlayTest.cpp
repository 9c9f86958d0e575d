#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/format.h>

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../core/Log.hpp"
#include "../core/SolverAi.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingPlayer.hpp"

using namespace mhl::core;

namespace
{
    // Always submits the same expression
    class ScriptedPlayer final : public Player
    {
    public:
        explicit ScriptedPlayer(Expression e = {}) : e_(std::move(e)) {}
        auto Play(std::shared_ptr<const RoundSnapshot>) -> Expression override { return e_; }

    private:
        Expression e_;
    };

    auto make_game(Config const& cfg,
                   std::unique_ptr<Player> player,
                   std::unique_ptr<Player> ai) -> GameImpl
    {
        std::vector<std::unique_ptr<Player>> ps;
        ps.emplace_back(std::make_unique<debug::RecordingPlayer>(std::move(player)));
        ps.emplace_back(std::make_unique<debug::RecordingPlayer>(std::move(ai)));
        return GameImpl(cfg, std::make_unique<ClassicRules>(), std::move(ps));
    }

    auto seeded(std::uint64_t seed) -> Config
    {
        Config cfg{};
        cfg.seed = seed;
        return cfg;
    }
} // anonymous namespace

TEST(Game, BetIsClamped)
{
    log::SetLevel(log::Level::Silent);
    GameImpl game = make_game(seeded(1), std::make_unique<ScriptedPlayer>(), std::make_unique<SolverAI>());

    EXPECT_EQ(game.SetBet(0), 1);
    EXPECT_EQ(game.SetBet(3), 3);
    EXPECT_EQ(game.SetBet(99), 5);
    EXPECT_EQ(game.Bet(), 5);
}

TEST(Game, TargetIndexIsChecked)
{
    GameImpl game = make_game(seeded(1), std::make_unique<ScriptedPlayer>(), std::make_unique<SolverAI>());
    EXPECT_EQ(game.Target(), 1);
    game.SetTargetIndex(1);
    EXPECT_EQ(game.Target(), 20);
    EXPECT_THROW(game.SetTargetIndex(2), error::StateError);
}

TEST(Game, RejectsBadConfig)
{
    Config cfg = seeded(1);
    cfg.targets.clear();
    EXPECT_THROW(make_game(cfg, std::make_unique<ScriptedPlayer>(), std::make_unique<SolverAI>()),
                 error::ConfigError);

    std::vector<std::unique_ptr<Player>> one;
    one.emplace_back(std::make_unique<ScriptedPlayer>());
    EXPECT_THROW(GameImpl(seeded(1), std::make_unique<ClassicRules>(), std::move(one)), error::AssertionError);
}

TEST(Game, InvalidPlayerLosesEveryRound)
{
    log::SetLevel(log::Level::Silent);
    Config const cfg = seeded(2024);
    GameImpl game = make_game(cfg, std::make_unique<ScriptedPlayer>(), std::make_unique<SolverAI>());
    game.SetTargetIndex(1);
    game.SetBet(5);

    int rounds{};
    while (!game.IsOver() && rounds < 50)
    {
        RoundResult const r = game.PlayRound();
        ++rounds;

        EXPECT_FALSE(r.player.Valid());
        EXPECT_LE(r.player_delta, 0);
        EXPECT_EQ(r.player_delta, -r.ai_delta);
        mhl::core::debug::CheckCredits(game, cfg);

        auto* rec = debug::AsRecording(game.PlayerAt(Side::AI));
        ASSERT_NE(rec, nullptr);
        EXPECT_EQ(rec->LastSnapshot().round, game.RoundsPlayed());
        EXPECT_EQ(rec->LastSnapshot().target, 20);
    }

    ASSERT_TRUE(game.IsOver());
    EXPECT_EQ(game.Winner(), Side::AI);
    EXPECT_EQ(game.Credits(Side::Player), 0);
    EXPECT_THROW(game.PlayRound(), error::StateError);
}

TEST(SelfPlay, Transcripts_And_End)
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    log::SetLevel(log::Level::Silent);

    for (std::uint64_t seed : {111ull, 222ull, 333ull})
    {
        Config const cfg = seeded(seed);
        GameImpl game = make_game(cfg, std::make_unique<SolverAI>(), std::make_unique<SolverAI>());
        game.SetTargetIndex(seed % 2);
        game.SetBet(2);

        std::string const path = fmt::format("_artifacts/game_{}.log", seed);
        {
            mhl::core::debug::AuditLogger audit(path);
            ASSERT_TRUE(audit.IsOpen());
            audit.start(game, seed);

            while (!game.IsOver() && game.RoundsPlayed() < 40)
            {
                RoundResult const r = game.PlayRound();
                audit.round(game, r);
                mhl::core::debug::CheckCredits(game, cfg);

                for (Side const s : {Side::Player, Side::AI})
                {
                    auto* rec = debug::AsRecording(game.PlayerAt(s));
                    ASSERT_NE(rec, nullptr) << "Player not wrapped with RecordingPlayer";
                    ASSERT_TRUE(rec->HasLast());

                    auto* solver = dynamic_cast<SolverAI*>(rec->Inner());
                    ASSERT_NE(solver, nullptr);
                    mhl::core::debug::CheckSearchResult(game.HandOf(s), solver->LastSearch());
                    if (!solver->UsedFallback()) EXPECT_EQ(rec->Last(), solver->LastSearch().expression);
                }
            }
            audit.end(game);
        }

        ASSERT_TRUE(fs::exists(path));
        ASSERT_GT(fs::file_size(path), 0u);

        std::ifstream in(path);
        std::string first, line, last;
        std::getline(in, first);
        while (std::getline(in, line)) last = line;
        EXPECT_EQ(first, fmt::format("Seed={}", seed));
        EXPECT_EQ(last.rfind("Winner=", 0), 0u);
    }
}

TEST(SelfPlay, SameSeedSameGame)
{
    log::SetLevel(log::Level::Silent);
    auto play = [](std::uint64_t seed)
    {
        GameImpl game = make_game(seeded(seed), std::make_unique<SolverAI>(), std::make_unique<SolverAI>());
        game.SetTargetIndex(1);
        std::vector<std::string> out;
        for (int i{}; i < 5 && !game.IsOver(); ++i)
        {
            RoundResult const r = game.PlayRound();
            out.push_back(Detail(r));
        }
        return out;
    };
    EXPECT_EQ(play(77), play(77));
}
