#pragma once

#include <lore/core/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace lore::config {

/**
 * @brief Tunables for the whole resolution pipeline.
 *
 * Read from the `[index]`, `[resolver]`, `[temporal]` and `[logging]` sections of the
 * config file. Missing keys keep their defaults; `LORE_ACTIVE_ON` and `LORE_LOG_LEVEL`
 * override the file.
 */
struct EngineConfig {
    std::size_t minTokenLength = 3;
    std::size_t minStemLength = 3;
    bool enableCache = true;
    bool strictFuzzyTies = false;
    std::optional<TimePoint> activeOn;
    std::string logLevel = "info";

    /**
     * @brief Load a config file.
     *
     * An explicit path that does not exist is FileNotFound. With no path the standard
     * location is used, and a missing default file yields the defaults.
     */
    static Result<EngineConfig> load(const std::string& path = "");

    // Defaults plus environment overrides, no file
    static Result<EngineConfig> fromEnvironment();

    Result<void> validate() const;

    // Set the spdlog level from logLevel
    void applyLogging() const;

private:
    Result<void> applyEnvironment();
};

} // namespace lore::config
