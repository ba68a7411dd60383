#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/environment.hpp"
#include "session/launch_error.hpp"

namespace sessionizer::session {

// Last path component with '.' replaced by '_'. Throws std::invalid_argument for "/" and similar.
std::string sessionNameFor(const std::filesystem::path &path);

class SessionManager {
public:
    virtual ~SessionManager() = default;

    virtual bool hasSession(const std::string &id) = 0;
    // Creates the session rooted at path unless one with this id already exists.
    virtual void ensureSession(const std::string &id, const std::filesystem::path &path) = 0;
    virtual void switchTo(const std::string &id) = 0;
};

class TmuxSessionManager : public SessionManager {
public:
    TmuxSessionManager(const sessionizer::Context &ctx, const sessionizer::Environment &env, bool dryRun = false);

    // Inside a client, or a tmux process is alive.
    bool serverRunning();

    bool hasSession(const std::string &id) override;
    void ensureSession(const std::string &id, const std::filesystem::path &path) override;
    void switchTo(const std::string &id) override;

private:
    void run(const std::vector<std::string> &args, const std::string &what);

    const sessionizer::Context &ctx_;
    const sessionizer::Environment &env_;
    bool dryRun_;
};

} // namespace sessionizer::session
