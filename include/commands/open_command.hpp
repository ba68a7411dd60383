#pragma once

#include <cstddef>
#include <filesystem>

#include "core/context.hpp"
#include "core/environment.hpp"
#include "session/selector.hpp"
#include "session/session_manager.hpp"

namespace sessionizer::commands {

struct OpenOptions {
    std::filesystem::path configFile;
    bool forceNested = false;
    bool listOnly = false;
    std::size_t jobs = 0;
};

// Discover repositories, let the user pick one and open a session there.
int runOpenCommand(
    const sessionizer::Context &ctx,
    const OpenOptions &options,
    const sessionizer::Environment &env,
    session::Selector &selector,
    session::SessionManager &sessions
);

} // namespace sessionizer::commands
