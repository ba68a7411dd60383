#include "core/environment.hpp"

#include <cstdlib>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sessionizer
{
    namespace
    {

        std::optional<std::string> readVariable(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr)
            {
                return std::nullopt;
            }
            return std::string(value);
        }

        fs::path detectHome()
        {
            if (auto home = readVariable("HOME"); home.has_value() && !home->empty())
            {
                return fs::path(*home);
            }
            if (const passwd *entry = getpwuid(getuid()); entry != nullptr && entry->pw_dir != nullptr)
            {
                return fs::path(entry->pw_dir);
            }
            return {};
        }

    } // namespace

    Environment Environment::fromProcess()
    {
        Environment env;
        env.home = detectHome();

        std::error_code ec;
        env.cwd = fs::current_path(ec);
        if (ec)
        {
            env.cwd = env.home;
        }

        env.multiplexerMarker = readVariable("TMUX");
        return env;
    }

} // namespace sessionizer
