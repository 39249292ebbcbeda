#pragma once

#include <cstdint>

#include <toml++/toml.h>

#include "savescan/api/savescan.hpp"

class ConfigManager;

// [engine] table of savescan.toml
struct EngineSettings
{
    std::int64_t cache_ttl_ms = 500;
    std::int64_t not_found_ttl_ms = 200;
    bool enable_full_scan = true;
    bool verbose = false;

    void loadFrom(const toml::table& section);
    toml::table toToml() const;

    savescan::Config toEngineConfig() const;

    // Registers load/save callbacks bound to this instance; it must outlive cfg
    bool registerWith(ConfigManager& cfg);
};
