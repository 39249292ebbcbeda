#pragma once

// SAVESCAN_PROFILING_LEVEL comes from CMake:
//   0 = off
//   1 = scope timings logged through the engine's debug sink
//   2 = Tracy zones on top of level 1

#ifndef SAVESCAN_PROFILING_LEVEL
#define SAVESCAN_PROFILING_LEVEL 0
#endif

#if SAVESCAN_PROFILING_LEVEL >= 1
#include "../api/logger.hpp"

#include <chrono>
#include <string>

namespace savescan::profiling
{

// Set by Engine::initialize; timings are dropped while it is null
inline Logger* g_profiling_logger = nullptr;

inline void SetProfilingLogger(Logger* logger) noexcept { g_profiling_logger = logger; }

class ScopeTimer
{
public:
    explicit ScopeTimer(const char* name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        if (!g_profiling_logger || !g_profiling_logger->debug)
            return;
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                            std::chrono::steady_clock::now() - start_).count();
        g_profiling_logger->debug(std::string("[PROFILE] ") + name_ + " took " + std::to_string(us) + " us");
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    const char* name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace savescan::profiling
#endif

#if SAVESCAN_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#include <cstring>

#define SAVESCAN_PROFILE_ZONE(name) \
    ZoneScoped;                     \
    ZoneName(name, std::strlen(name))
#else
#define SAVESCAN_PROFILE_ZONE(name) ((void)0)
#endif

#if SAVESCAN_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#else
#define PROFILE_SCOPE_CUSTOM(nameExpr)                               \
    const char* const __profiling_name = (nameExpr);                 \
    SAVESCAN_PROFILE_ZONE(__profiling_name);                         \
    ::savescan::profiling::ScopeTimer __profiling_timer(__profiling_name)
#endif

#define PROFILE_SCOPE_FUNCTION() PROFILE_SCOPE_CUSTOM(__FUNCTION__)
