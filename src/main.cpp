//
// main.cpp
//

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <vector>

#include "core/Game.hpp"
#include "core/RandomAi.hpp"
#include "core/Scenario.hpp"
#include "core/TacticalRules.hpp"
#include "core/Exception.hpp"
#include "debug/AuditLogger.hpp"
#include "replay/codec.hpp"
#include "replay/Replayer.hpp"

namespace
{
    struct CliConfig
    {
        hexwar::core::Config game{};
        std::uint32_t episodes{1};
        std::filesystem::path out_dir{"hexwar_out"};
        std::optional<std::filesystem::path> verify{};
        bool verbose{false};
        bool help{false};
    };

    auto PrintUsage() -> void
    {
        std::print("usage: hexwar [--seed N] [--episodes N] [--max-turns N] [--max-steps N]\n"
                   "              [--out DIR] [--verbose]\n"
                   "       hexwar --verify FILE.hxr\n");
    }

    auto ParseArgs(int argc, char** argv) -> std::optional<CliConfig>
    {
        CliConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

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

            bool ok = true;
            std::uint64_t v{};
            std::string s;

            if (arg == "--seed")
            {
                ok = next_uint(v);
                if (ok) { cfg.game.seed = v; }
            }
            else if (arg == "--episodes")
            {
                ok = next_uint(v) && v > 0;
                if (ok) { cfg.episodes = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--max-turns")
            {
                ok = next_uint(v) && v > 0 && v <= UINT16_MAX;
                if (ok) { cfg.game.max_turns = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--max-steps")
            {
                ok = next_uint(v) && v > 0 && v <= UINT32_MAX;
                if (ok) { cfg.game.max_steps = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--out")
            {
                ok = next_str(s);
                if (ok) { cfg.out_dir = s; }
            }
            else if (arg == "--verify")
            {
                ok = next_str(s);
                if (ok) { cfg.verify = std::filesystem::path{s}; }
            }
            else if (arg == "--verbose")
            {
                cfg.verbose = true;
                cfg.game.log_violations = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                cfg.help = true;
            }
            else
            {
                std::print(stderr, "[hexwar] unknown argument '{}'\n", arg);
                return std::nullopt;
            }

            if (!ok)
            {
                std::print(stderr, "[hexwar] bad or missing value for {}\n", arg);
                return std::nullopt;
            }
        }
        return cfg;
    }

    auto Verify(std::filesystem::path const& path) -> int
    {
        using namespace hexwar::core;

        auto const bytes = replay::ReadReplayFile(path);
        if (!bytes)
        {
            std::print(stderr, "[hexwar] {}\n", bytes.error().message);
            return 2;
        }

        auto const log = replay::DecodeReplay(*bytes);
        if (!log)
        {
            std::print(stderr, "[hexwar] {}: {}\n", path.string(), log.error().message);
            return 2;
        }

        auto const verdict = replay::VerifyReplay(*log);
        if (!verdict)
        {
            std::print("[hexwar] DIVERGED {}\n", replay::describe(verdict.error()));
            return 1;
        }

        std::print("[hexwar] OK {} records ({} rejected), winner={}, truncated={}\n",
                   verdict->records, verdict->rejected,
                   verdict->winner ? static_cast<int>(*verdict->winner) : -1, verdict->truncated);
        return 0;
    }

    auto RunEpisode(CliConfig const& cli, std::uint64_t const seed) -> void
    {
        using namespace hexwar::core;

        GameImpl game(cli.game, std::make_unique<TacticalRules>());
        (void)game.Reset(DefaultScenario(), seed);

        std::vector<std::unique_ptr<Player>> players;
        players.emplace_back(std::make_unique<RandomAI>(seed + 1));
        players.emplace_back(std::make_unique<RandomAI>(seed + 2));

        debug::AuditLogger audit((cli.out_dir / std::format("episode_{}.log", seed)).string());
        audit.start(game);

        while (!game.Over())
        {
            PlyrIdxT const actor = game.ActingPlayer();
            ActionRequest const req = players[actor]->Play(game.SnapshotFor(actor));
            (void)game.Step(req);
            audit.record(game.History().back());

            if (cli.verbose)
            {
                std::print("{}\n", debug::FormatRecord(game.History().back()));
            }
        }
        audit.end(game);

        auto const replay_path = cli.out_dir / std::format("episode_{}.hxr", seed);
        replay::WriteReplayFile(replay_path, replay::BuildReplay(game));

        std::print("[hexwar] seed {} finished after {} steps: winner={} truncated={} live=[{},{}]\n",
                   seed, game.Steps(), game.Winner() ? static_cast<int>(*game.Winner()) : -1,
                   game.Truncated(), game.State().LiveCount(0), game.State().LiveCount(1));
    }
}

int main(int argc, char** argv)
{
    using namespace hexwar::core;

    auto const cli = ParseArgs(argc, argv);
    if (!cli)
    {
        PrintUsage();
        return 2;
    }
    if (cli->help)
    {
        PrintUsage();
        return 0;
    }

    try
    {
        if (cli->verify) return Verify(*cli->verify);

        std::filesystem::create_directories(cli->out_dir);
        std::print("[hexwar] {} episode(s) from seed {} into {}\n",
                   cli->episodes, cli->game.seed, cli->out_dir.string());

        for (std::uint32_t ep{}; ep < cli->episodes; ++ep)
        {
            RunEpisode(*cli, cli->game.seed + ep);
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}", e);
        return 1;
    }
    catch (std::filesystem::filesystem_error const& e)
    {
        std::print(stderr, "[hexwar] {}\n", e.what());
        return 1;
    }
    return 0;
}
