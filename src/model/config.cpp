#include "model/config.hpp"

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace sessionizer::model
{

    namespace
    {

        constexpr const char *kSearchPathsKey = "search_paths";
        constexpr const char *kNestedKey = "nested";

        std::vector<std::optional<std::string>> toSearchPaths(const json &node)
        {
            if (!node.is_array())
            {
                throw ConfigError(std::string("'") + kSearchPathsKey + "' must be an array");
            }

            std::vector<std::optional<std::string>> out;
            out.reserve(node.size());
            for (std::size_t i = 0; i < node.size(); ++i)
            {
                const json &item = node[i];
                if (item.is_null())
                {
                    out.emplace_back(std::nullopt);
                    continue;
                }
                if (!item.is_string())
                {
                    throw ConfigError(std::string("'") + kSearchPathsKey + "' entry " + std::to_string(i) +
                                      " must be a string or null, got " + item.type_name());
                }
                out.emplace_back(item.get<std::string>());
            }
            return out;
        }

    } // namespace

    Config parseConfig(const json &document)
    {
        if (!document.is_object())
        {
            throw ConfigError("configuration root must be an object");
        }

        Config config;
        if (!document.contains(kSearchPathsKey))
        {
            throw ConfigError(std::string("missing required key '") + kSearchPathsKey + "'");
        }
        config.searchPaths = toSearchPaths(document[kSearchPathsKey]);

        if (document.contains(kNestedKey) && !document[kNestedKey].is_null())
        {
            const json &nested = document[kNestedKey];
            if (!nested.is_boolean())
            {
                throw ConfigError(std::string("'") + kNestedKey + "' must be a boolean, got " + nested.type_name());
            }
            config.nested = nested.get<bool>();
        }

        return config;
    }

    Config loadConfig(const fs::path &configFile)
    {
        json document;
        try
        {
            document = io::loadJsonFile(configFile);
        }
        catch (const json::exception &ex)
        {
            throw ConfigError("Failed to parse configuration file " + configFile.string() + ": " + ex.what());
        }
        catch (const std::runtime_error &ex)
        {
            throw ConfigError(std::string("Failed to read configuration file: ") + ex.what());
        }

        try
        {
            return parseConfig(document);
        }
        catch (const ConfigError &ex)
        {
            throw ConfigError("Invalid configuration file " + configFile.string() + ": " + ex.what());
        }
    }

} // namespace sessionizer::model
