#include "scan/path_normalizer.hpp"

#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;

namespace sessionizer::scan
{

    std::string expandHome(const std::string &raw, const fs::path &home)
    {
        if (home.empty() || raw.empty() || raw.front() != '~')
        {
            return raw;
        }
        if (raw.size() == 1)
        {
            return home.string();
        }
        if (raw[1] != '/')
        {
            // ~user is left to the shell.
            return raw;
        }
        // Joined as text: path::operator/ would drop home for "~//x".
        return home.string() + raw.substr(1);
    }

    fs::path cleanPath(const fs::path &path)
    {
        fs::path out = path.lexically_normal();
        if (out.empty())
        {
            return fs::path(".");
        }
        // lexically_normal keeps a trailing separator as an empty filename.
        if (!out.has_filename() && !out.relative_path().empty())
        {
            out = out.parent_path();
        }
        return out;
    }

    bool isDescendantOf(const fs::path &path, const fs::path &ancestor)
    {
        const auto pathCount = std::distance(path.begin(), path.end());
        const auto ancestorCount = std::distance(ancestor.begin(), ancestor.end());
        if (ancestorCount == 0 || ancestorCount >= pathCount)
        {
            return false;
        }
        return std::equal(ancestor.begin(), ancestor.end(), path.begin());
    }

    std::vector<fs::path> normalizeRoots(const std::vector<std::optional<std::string>> &raw, const Environment &env)
    {
        std::vector<fs::path> cleaned;
        cleaned.reserve(raw.size());
        for (const auto &entry : raw)
        {
            if (!entry.has_value() || entry->empty())
            {
                continue;
            }

            fs::path candidate(expandHome(*entry, env.home));
            if (candidate.is_relative())
            {
                candidate = env.cwd / candidate;
            }
            cleaned.push_back(cleanPath(candidate));
        }

        std::sort(cleaned.begin(), cleaned.end());
        cleaned.erase(std::unique(cleaned.begin(), cleaned.end()), cleaned.end());

        std::vector<fs::path> result;
        for (const auto &path : cleaned)
        {
            const bool contained = std::any_of(cleaned.begin(), cleaned.end(), [&path](const fs::path &other)
                                               { return other != path && isDescendantOf(path, other); });
            if (!contained)
            {
                result.push_back(path);
            }
        }
        return result;
    }

} // namespace sessionizer::scan
