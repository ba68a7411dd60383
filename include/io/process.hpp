#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace sessionizer::io {

// Exit status a child reports when the program could not be executed.
constexpr int kExecFailedCode = 127;

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    long long processId = -1;
};

struct CaptureResult : ProcessResult {
    std::string output;
};

struct CaptureOptions {
    std::string input;          // written to the child's stdin, then closed
    bool discardStderr = false;
};

std::string shellQuote(const std::string &value);

// Child inherits the terminal.
ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const sessionizer::Context &ctx,
    bool dryRun = false
);

// Feeds options.input to the child's stdin and collects its stdout.
CaptureResult runCommandCapture(
    const std::string &command,
    const std::vector<std::string> &args,
    const CaptureOptions &options,
    const sessionizer::Context &ctx,
    bool dryRun = false
);

} // namespace sessionizer::io
