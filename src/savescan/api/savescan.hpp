#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "game_telemetry.hpp"
#include "logger.hpp"
#include "../memory/MemoryLayout.hpp"
#include "../util/ErrorContext.hpp"

namespace savescan
{

class SnapshotBuffer;
class ISnapshotProvider;
struct LocatorStats;

struct Config
{
    bool verbose = false;
    // Lifetime of a cached layout for the same snapshot id
    std::chrono::milliseconds cache_ttl{ 500 };
    // Lifetime of a cached "not found" result
    std::chrono::milliseconds not_found_ttl{ 200 };
    // Pointer-pair sweep over the whole buffer; the slowest strategy
    bool enable_full_scan = true;
};

enum class ExtractStatus
{
    Ok,
    LayoutNotFound,
    CaptureFailed
};

struct ExtractionResult
{
    ExtractStatus status = ExtractStatus::LayoutNotFound;
    GameTelemetry telemetry;
    std::optional<MemoryLayout> layout;
    bool from_cache = false;

    bool ok() const { return status == ExtractStatus::Ok; }
};

/**
 * @brief Save state telemetry extraction engine
 *
 * Locates the working RAM regions inside a snapshot (memoized per
 * snapshot id) and decodes telemetry from them. The engine never keeps a
 * reference to a snapshot after the call that received it returns.
 *
 * extract() may be called from several threads; the layout cache
 * serializes locator runs.
 */
class Engine
{
public:
    Engine();
    ~Engine() noexcept;

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    bool initialize(const Config& cfg, Logger loggers = {});

    /// Extract using the snapshot's capture id as the cache key
    ExtractionResult extract(const SnapshotBuffer& snapshot);
    ExtractionResult extract(const SnapshotBuffer& snapshot, std::uint64_t snapshot_id);
    ExtractionResult extract(const std::uint8_t* data, std::size_t size, std::uint64_t snapshot_id);

    /// Capture one snapshot from the provider and extract from it
    ExtractionResult capture_and_extract(ISnapshotProvider& provider);

    void invalidate_cache();

    /// May be called while other threads extract
    void set_error_callback(ErrorCallback callback);

    std::string last_error() const;

    const Config& config() const;

    /// Locator counters; read while no extract() is in flight
    LocatorStats locator_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace savescan
