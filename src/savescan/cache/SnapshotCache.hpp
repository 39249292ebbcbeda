#pragma once

#include "TtlCache.hpp"
#include "../scanning/MemoryLocator.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace savescan
{

struct CachedLocate
{
    LocateResult result;
    bool from_cache = false;
};

/**
 * @brief Short-lived memo of the last locator result, keyed by snapshot id
 *
 * Holds one entry. Found layouts live for the regular TTL; NotFound and
 * BufferTooSmall results are kept for the shorter not-found TTL so a
 * foreign buffer is not rescanned on every request. One mutex covers the
 * whole check, locate and store sequence, so concurrent callers with the
 * same id run the locator once.
 */
class SnapshotCache
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultTtl{ 500 };
    static constexpr std::chrono::milliseconds kDefaultNotFoundTtl{ 200 };

    explicit SnapshotCache(std::chrono::milliseconds ttl = kDefaultTtl,
                           std::chrono::milliseconds not_found_ttl = kDefaultNotFoundTtl, NowFn now = {});

    CachedLocate GetOrLocate(uint64_t snapshot_id, const std::function<LocateResult()>& locate);

    void Invalidate();

    void SetTtl(std::chrono::milliseconds ttl, std::chrono::milliseconds not_found_ttl);

    uint64_t Hits() const;
    uint64_t Misses() const;
    size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds not_found_ttl_;
    TtlCache<uint64_t, LocateResult> cache_;
};

} // namespace savescan
