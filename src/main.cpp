#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "commands/open_command.hpp"
#include "core/context.hpp"
#include "core/environment.hpp"
#include "session/selector.hpp"
#include "session/session_manager.hpp"

namespace
{

    constexpr const char *kAppName = "sessionizer";
    constexpr const char *kVersion = "0.3.0";

    struct CliOptions
    {
        sessionizer::commands::OpenOptions open;
        bool dryRun = false;
        bool verbose = false;
        bool help = false;
        bool version = false;
    };

    void printHelp()
    {
        std::cout << kAppName << " " << kVersion << "\n"
                  << "Pick a git repository below the configured roots and open a tmux session in it.\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " -c <config.json> [options]\n"
                  << "\n"
                  << "Options:\n"
                  << "  -c, --config <file>   JSON configuration (search_paths, nested)\n"
                  << "  -n, --nested          Also look for repositories inside repositories\n"
                  << "  -l, --list            Print the repositories instead of opening the picker\n"
                  << "  -j, --jobs <N>        Number of scan threads (default: CPU count, 2..8)\n"
                  << "      --dry-run         Print the tmux commands instead of running them\n"
                  << "  -v, --verbose         Debug diagnostics on stderr\n"
                  << "  -h, --help            Show this help\n"
                  << "      --version         Show the version\n"
                  << "\n"
                  << "Example configuration (JSON only; YAML files must be converted):\n"
                  << "  { \"search_paths\": [\"~/code\", \"~/work\"], \"nested\": false }\n";
    }

    std::optional<std::size_t> parseJobs(const std::string &value)
    {
        try
        {
            std::size_t consumed = 0;
            const long jobs = std::stol(value, &consumed);
            if (consumed != value.size() || jobs <= 0)
            {
                return std::nullopt;
            }
            return static_cast<std::size_t>(jobs);
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    // Returns false after printing a diagnostic when the arguments are unusable.
    bool parseArgs(int argc, char **argv, CliOptions &out)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            auto takeValue = [&](std::string &value) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "[error] Missing value for " << arg << '\n';
                    return false;
                }
                value = argv[++i];
                return true;
            };

            if (arg == "-c" || arg == "--config")
            {
                std::string value;
                if (!takeValue(value))
                {
                    return false;
                }
                out.open.configFile = value;
            }
            else if (arg.rfind("--config=", 0) == 0)
            {
                out.open.configFile = arg.substr(std::string("--config=").size());
            }
            else if (arg == "-n" || arg == "--nested")
            {
                out.open.forceNested = true;
            }
            else if (arg == "-l" || arg == "--list")
            {
                out.open.listOnly = true;
            }
            else if (arg == "-j" || arg == "--jobs")
            {
                std::string value;
                if (!takeValue(value))
                {
                    return false;
                }
                const auto jobs = parseJobs(value);
                if (!jobs.has_value())
                {
                    std::cerr << "[error] Invalid job count: " << value << '\n';
                    return false;
                }
                out.open.jobs = *jobs;
            }
            else if (arg == "--dry-run")
            {
                out.dryRun = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                out.verbose = true;
            }
            else if (arg == "-h" || arg == "--help")
            {
                out.help = true;
            }
            else if (arg == "--version")
            {
                out.version = true;
            }
            else
            {
                std::cerr << "[error] Unknown option: " << arg << '\n';
                return false;
            }
        }
        return true;
    }

} // namespace

int main(int argc, char **argv)
{
    CliOptions options;
    if (!parseArgs(argc, argv, options))
    {
        printHelp();
        return 1;
    }
    if (options.help)
    {
        printHelp();
        return 0;
    }
    if (options.version)
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    const sessionizer::Context ctx(options.verbose);
    if (options.open.configFile.empty())
    {
        ctx.error("Configuration file is required.");
        return 1;
    }

    // A selector that quits before reading all candidates must not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    try
    {
        const sessionizer::Environment env = sessionizer::Environment::fromProcess();
        sessionizer::session::FzfSelector selector(ctx);
        sessionizer::session::TmuxSessionManager sessions(ctx, env, options.dryRun);
        return sessionizer::commands::runOpenCommand(ctx, options.open, env, selector, sessions);
    }
    catch (const std::exception &ex)
    {
        ctx.error(ex.what());
        return 1;
    }
}
