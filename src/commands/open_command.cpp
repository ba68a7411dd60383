#include "commands/open_command.hpp"

#include <string>
#include <vector>

#include "model/config.hpp"
#include "scan/path_normalizer.hpp"
#include "scan/repo_scanner.hpp"

namespace fs = std::filesystem;

namespace sessionizer::commands
{

    int runOpenCommand(
        const sessionizer::Context &ctx,
        const OpenOptions &options,
        const sessionizer::Environment &env,
        session::Selector &selector,
        session::SessionManager &sessions)
    {
        const model::Config config = model::loadConfig(options.configFile);

        scan::ScanOptions scanOptions;
        scanOptions.nested = options.forceNested || config.nested.value_or(false);
        scanOptions.workers = options.jobs;

        const std::vector<fs::path> roots = scan::normalizeRoots(config.searchPaths, env);
        ctx.debug("Scanning ", roots.size(), " root(s), nested=", scanOptions.nested ? "true" : "false");

        const std::vector<fs::path> repos = scan::scanRepositories(roots, scanOptions, ctx);
        ctx.debug("Found ", repos.size(), " repositories");

        if (options.listOnly)
        {
            for (const auto &repo : repos)
            {
                ctx.log(repo.string());
            }
            return 0;
        }

        if (repos.empty())
        {
            ctx.warn("No repositories found");
            return 0;
        }

        std::vector<std::string> choices;
        choices.reserve(repos.size());
        for (const auto &repo : repos)
        {
            choices.push_back(repo.string());
        }

        const auto selected = selector.select(choices);
        if (!selected.has_value() || selected->empty())
        {
            return 0;
        }

        const fs::path selectedPath(*selected);
        const std::string sessionName = session::sessionNameFor(selectedPath);
        ctx.debug("Opening session ", sessionName, " at ", selectedPath.string());

        sessions.ensureSession(sessionName, selectedPath);
        sessions.switchTo(sessionName);
        return 0;
    }

} // namespace sessionizer::commands
