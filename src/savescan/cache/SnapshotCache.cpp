#include "SnapshotCache.hpp"

namespace savescan
{

SnapshotCache::SnapshotCache(std::chrono::milliseconds ttl, std::chrono::milliseconds not_found_ttl, NowFn now)
    : ttl_(ttl)
    , not_found_ttl_(not_found_ttl)
    , cache_(std::move(now))
{
}

CachedLocate SnapshotCache::GetOrLocate(uint64_t snapshot_id, const std::function<LocateResult()>& locate)
{
    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t misses_before = cache_.misses();
    CachedLocate out;
    out.result = cache_.getOrComputeWith(
        snapshot_id,
        [this](const LocateResult& result)
        { return result.Found() ? Clock::duration(ttl_) : Clock::duration(not_found_ttl_); },
        [&locate] { return locate ? locate() : LocateResult{}; });
    out.from_cache = cache_.misses() == misses_before;
    return out;
}

void SnapshotCache::Invalidate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.invalidate();
}

void SnapshotCache::SetTtl(std::chrono::milliseconds ttl, std::chrono::milliseconds not_found_ttl)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ttl_ = ttl;
    not_found_ttl_ = not_found_ttl;
    cache_.invalidate();
}

uint64_t SnapshotCache::Hits() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.hits();
}

uint64_t SnapshotCache::Misses() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.misses();
}

size_t SnapshotCache::Size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace savescan
