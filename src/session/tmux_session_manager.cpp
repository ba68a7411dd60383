#include "session/session_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "io/process.hpp"
#include "scan/path_normalizer.hpp"

namespace fs = std::filesystem;

namespace sessionizer::session
{
    namespace
    {

        constexpr const char *kTmux = "tmux";

        // "=" pins tmux to an exact session name instead of a prefix match.
        std::string exactTarget(const std::string &id)
        {
            return "=" + id;
        }

    } // namespace

    std::string sessionNameFor(const fs::path &path)
    {
        const fs::path cleaned = scan::cleanPath(path);
        std::string name = cleaned.filename().string();
        if (name.empty() || name == "." || name == "..")
        {
            throw std::invalid_argument("Cannot derive a session name from: " + path.string());
        }
        std::replace(name.begin(), name.end(), '.', '_');
        return name;
    }

    TmuxSessionManager::TmuxSessionManager(const sessionizer::Context &ctx, const sessionizer::Environment &env, bool dryRun)
        : ctx_(ctx), env_(env), dryRun_(dryRun)
    {
    }

    bool TmuxSessionManager::serverRunning()
    {
        if (env_.multiplexerMarker.has_value())
        {
            return true;
        }
        if (dryRun_)
        {
            return false;
        }

        io::CaptureOptions options;
        options.discardStderr = true;
        const io::CaptureResult result = io::runCommandCapture("pgrep", {kTmux}, options, ctx_);
        if (result.code == io::kExecFailedCode)
        {
            ctx_.debug("pgrep unavailable, assuming no tmux server");
        }
        return result.code == 0;
    }

    bool TmuxSessionManager::hasSession(const std::string &id)
    {
        if (dryRun_ || !serverRunning())
        {
            return false;
        }

        io::CaptureOptions options;
        options.discardStderr = true;
        const io::CaptureResult result = io::runCommandCapture(kTmux, {"has-session", "-t", exactTarget(id)}, options, ctx_);
        if (result.code == io::kExecFailedCode || result.code < 0)
        {
            throw LaunchError("Failed to launch tmux: " + result.commandLine);
        }
        return result.code == 0;
    }

    void TmuxSessionManager::ensureSession(const std::string &id, const fs::path &path)
    {
        if (hasSession(id))
        {
            ctx_.debug("Reusing session ", id);
            return;
        }
        run({"new-session", "-d", "-s", id, "-c", path.string()}, "create session " + id);
    }

    void TmuxSessionManager::switchTo(const std::string &id)
    {
        if (env_.multiplexerMarker.has_value())
        {
            run({"switch-client", "-t", exactTarget(id)}, "switch to session " + id);
            return;
        }
        run({"attach-session", "-t", exactTarget(id)}, "attach to session " + id);
    }

    void TmuxSessionManager::run(const std::vector<std::string> &args, const std::string &what)
    {
        const io::ProcessResult result = io::runCommand(kTmux, args, {}, ctx_, dryRun_);
        if (dryRun_)
        {
            ctx_.log(result.commandLine);
            return;
        }
        if (result.code == io::kExecFailedCode || result.code < 0)
        {
            throw LaunchError("Failed to launch tmux: " + result.commandLine);
        }
        if (result.code != 0)
        {
            throw LaunchError("tmux failed to " + what + " (exit " + std::to_string(result.code) + ")");
        }
    }

} // namespace sessionizer::session
