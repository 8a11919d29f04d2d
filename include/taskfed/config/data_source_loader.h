#pragma once

#include <taskfed/config/data_source_config.h>
#include <taskfed/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace taskfed::config {

struct LoaderOptions {
    std::optional<std::filesystem::path> configPath;
    bool useEnvironment = true;
    std::string envPrefix = "DATASOURCE";
    bool requireConfigFile = false;
    // Replaces the built-in search list when set (tests, embedding)
    std::optional<std::vector<std::filesystem::path>> searchPaths;
};

/**
 * @brief Loads and validates the multi-source configuration.
 *
 * Resolution order:
 * 1. Explicit config file
 * 2. Default locations (./config/data-sources.json, ./.taskfed/data-sources.json,
 *    $XDG_CONFIG_HOME/taskfed/data-sources.json)
 * 3. Environment (<PREFIX>_COUNT, <PREFIX>_<i>_ID, ...)
 * 4. Built-in default: one filesystem source at ./data
 *
 * Per-source credential overrides (<PREFIX>_<SOURCE_ID>_HOST, _PASSWORD, ...)
 * are applied on top of whichever configuration was found, then the result
 * is validated.
 */
class DataSourceConfigLoader {
public:
    Result<MultiSourceConfig> load(const LoaderOptions& options = {}) const;

    /**
     * @brief Read one configuration file.
     * @return nullopt when the file does not exist; an error when it exists
     *         but cannot be parsed (YAML is rejected)
     */
    Result<std::optional<MultiSourceConfig>> loadFromFile(const std::filesystem::path& path) const;

    Result<std::optional<MultiSourceConfig>> loadFromEnvironment(const std::string& prefix) const;

    void applyEnvironmentOverrides(MultiSourceConfig& config, const std::string& prefix) const;

    /**
     * @brief Validate and write a configuration as pretty-printed JSON.
     * Parent directories are created as needed.
     */
    Result<void> save(const MultiSourceConfig& config, const std::filesystem::path& path) const;

    static std::vector<std::filesystem::path> defaultSearchPaths();

private:
    Result<SourceConfig> loadSourceFromEnvironment(const std::string& prefix, int index) const;
};

} // namespace taskfed::config
