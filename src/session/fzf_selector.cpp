#include "session/selector.hpp"

#include <utility>

#include "io/process.hpp"

namespace sessionizer::session
{
    namespace
    {

        // fzf: 1 = nothing matched, 130 = interrupted with Esc or Ctrl-C.
        constexpr int kNoMatchCode = 1;
        constexpr int kInterruptedCode = 130;

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return "";
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

    } // namespace

    FzfSelector::FzfSelector(const sessionizer::Context &ctx, std::string command, std::vector<std::string> args)
        : ctx_(ctx), command_(std::move(command)), args_(std::move(args))
    {
    }

    std::optional<std::string> FzfSelector::select(const std::vector<std::string> &candidates)
    {
        io::CaptureOptions options;
        for (const auto &candidate : candidates)
        {
            options.input += candidate;
            options.input += '\n';
        }

        const io::CaptureResult result = io::runCommandCapture(command_, args_, options, ctx_);
        if (result.code == io::kExecFailedCode || result.code < 0)
        {
            throw LaunchError("Failed to launch selector: " + result.commandLine);
        }
        if (result.code == kNoMatchCode || result.code == kInterruptedCode)
        {
            ctx_.debug("Selector returned without a choice (exit ", result.code, ")");
            return std::nullopt;
        }
        if (result.code != 0)
        {
            throw LaunchError("Selector failed with exit code " + std::to_string(result.code) + ": " + result.commandLine);
        }

        std::string selected = trim(result.output);
        if (selected.empty())
        {
            return std::nullopt;
        }
        return selected;
    }

} // namespace sessionizer::session
