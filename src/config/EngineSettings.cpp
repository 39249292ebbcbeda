#include "EngineSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <string>
#include <utility>

namespace
{
// TTLs above a minute make no sense for a live snapshot source
constexpr std::int64_t kMaxTtlMs = 60000;

std::int64_t readTtl(const toml::table& section, const char* key, std::int64_t fallback)
{
    auto value = section[key].value<std::int64_t>();
    if (!value)
        return fallback;

    if (*value < 0 || *value > kMaxTtlMs)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Ignoring out of range engine.") + key,
                                            std::to_string(*value) + " ms");
        return fallback;
    }
    return *value;
}
} // namespace

void EngineSettings::loadFrom(const toml::table& section)
{
    const EngineSettings defaults;
    cache_ttl_ms = readTtl(section, "cache_ttl_ms", defaults.cache_ttl_ms);
    not_found_ttl_ms = readTtl(section, "not_found_ttl_ms", defaults.not_found_ttl_ms);
    enable_full_scan = section["enable_full_scan"].value_or(defaults.enable_full_scan);
    verbose = section["verbose"].value_or(defaults.verbose);
}

toml::table EngineSettings::toToml() const
{
    toml::table t;
    t.insert("cache_ttl_ms", cache_ttl_ms);
    t.insert("not_found_ttl_ms", not_found_ttl_ms);
    t.insert("enable_full_scan", enable_full_scan);
    t.insert("verbose", verbose);
    return t;
}

savescan::Config EngineSettings::toEngineConfig() const
{
    savescan::Config cfg;
    cfg.verbose = verbose;
    cfg.cache_ttl = std::chrono::milliseconds(cache_ttl_ms);
    cfg.not_found_ttl = std::chrono::milliseconds(not_found_ttl_ms);
    cfg.enable_full_scan = enable_full_scan;
    return cfg;
}

bool EngineSettings::registerWith(ConfigManager& cfg)
{
    TableCallbacks callbacks;
    callbacks.load = [this](const toml::table& section) { loadFrom(section); };
    callbacks.save = [this]() { return toToml(); };
    return cfg.registerTable("engine", std::move(callbacks),
                             { "cache_ttl_ms", "not_found_ttl_ms", "enable_full_scan", "verbose" });
}
