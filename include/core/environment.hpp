#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sessionizer {

// Process state read once at startup and handed to whoever needs it.
struct Environment {
    std::filesystem::path home;
    std::filesystem::path cwd;
    std::optional<std::string> multiplexerMarker; // $TMUX when inside a client

    static Environment fromProcess();
};

} // namespace sessionizer
