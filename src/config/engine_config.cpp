#include <spdlog/spdlog.h>
#include <lore/config/config_helpers.h>
#include <lore/config/engine_config.h>
#include <lore/temporal/time_scoped.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <system_error>

namespace lore::config {

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn",
                                                        "error", "critical", "off"};

Result<std::size_t> parseCount(const std::string& key, const std::string& raw) {
    std::size_t value = 0;
    const auto* first = raw.data();
    const auto* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("{}: expected a non-negative integer, got '{}'", key, raw)};
    }
    return value;
}

Result<bool> parseFlag(const std::string& key, const std::string& raw) {
    if (auto v = parse_bool(raw)) {
        return *v;
    }
    return Error{ErrorCode::InvalidArgument,
                 std::format("{}: expected true or false, got '{}'", key, raw)};
}

Result<TimePoint> parseActiveOn(const std::string& source, const std::string& raw) {
    auto parsed = temporal::parseInstant(raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("{}: {}", source, parsed.error().message)};
    }
    return parsed.value();
}

} // namespace

Result<EngineConfig> EngineConfig::load(const std::string& path) {
    const char* envPath = std::getenv("LORE_CONFIG");
    const bool explicitPath = !path.empty() || (envPath && *envPath);
    const auto configPath = get_config_path(path.empty() ? "" : expand_tilde(path).string());

    std::error_code ec;
    if (!std::filesystem::exists(configPath, ec)) {
        if (explicitPath) {
            return Error{ErrorCode::FileNotFound,
                         std::format("config file not found: {}", configPath.string())};
        }
        spdlog::debug("No config file at {}, using defaults", configPath.string());
        return fromEnvironment();
    }

    EngineConfig config;

    if (auto v = parse_config_value(configPath, "index", "min_token_length"); !v.empty()) {
        auto n = parseCount("index.min_token_length", v);
        if (!n) {
            return n.error();
        }
        config.minTokenLength = n.value();
    }
    if (auto v = parse_config_value(configPath, "resolver", "min_stem_length"); !v.empty()) {
        auto n = parseCount("resolver.min_stem_length", v);
        if (!n) {
            return n.error();
        }
        config.minStemLength = n.value();
    }
    if (auto v = parse_config_value(configPath, "resolver", "enable_cache"); !v.empty()) {
        auto b = parseFlag("resolver.enable_cache", v);
        if (!b) {
            return b.error();
        }
        config.enableCache = b.value();
    }
    if (auto v = parse_config_value(configPath, "resolver", "strict_fuzzy_ties"); !v.empty()) {
        auto b = parseFlag("resolver.strict_fuzzy_ties", v);
        if (!b) {
            return b.error();
        }
        config.strictFuzzyTies = b.value();
    }
    if (auto v = parse_config_value(configPath, "temporal", "active_on"); !v.empty()) {
        auto at = parseActiveOn("temporal.active_on", v);
        if (!at) {
            return at.error();
        }
        config.activeOn = at.value();
    }
    if (auto v = parse_config_value(configPath, "logging", "level"); !v.empty()) {
        config.logLevel = common::foldCase(v);
    }

    if (auto r = config.applyEnvironment(); !r) {
        return r.error();
    }
    if (auto r = config.validate(); !r) {
        return r.error();
    }

    spdlog::debug("Loaded config from {}", configPath.string());
    return config;
}

Result<EngineConfig> EngineConfig::fromEnvironment() {
    EngineConfig config;
    if (auto r = config.applyEnvironment(); !r) {
        return r.error();
    }
    if (auto r = config.validate(); !r) {
        return r.error();
    }
    return config;
}

Result<void> EngineConfig::applyEnvironment() {
    if (const char* activeOnEnv = std::getenv("LORE_ACTIVE_ON"); activeOnEnv && *activeOnEnv) {
        auto at = parseActiveOn("LORE_ACTIVE_ON", activeOnEnv);
        if (!at) {
            return at.error();
        }
        activeOn = at.value();
    }
    if (const char* levelEnv = std::getenv("LORE_LOG_LEVEL"); levelEnv && *levelEnv) {
        logLevel = common::foldCase(common::trimmed(levelEnv));
    }
    return {};
}

Result<void> EngineConfig::validate() const {
    if (minTokenLength == 0) {
        return Error{ErrorCode::InvalidArgument, "index.min_token_length must be at least 1"};
    }
    if (minStemLength == 0) {
        return Error{ErrorCode::InvalidArgument, "resolver.min_stem_length must be at least 1"};
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), logLevel) == kLogLevels.end()) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("logging.level: unknown level '{}'", logLevel)};
    }
    return {};
}

void EngineConfig::applyLogging() const {
    spdlog::set_level(spdlog::level::from_str(logLevel));
}

} // namespace lore::config
