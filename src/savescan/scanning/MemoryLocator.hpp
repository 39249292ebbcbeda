#pragma once

#include "ILocatorStrategy.hpp"
#include "LocatorCreateInfo.hpp"
#include "../api/logger.hpp"
#include "../memory/AddressTable.hpp"
#include "../memory/MemoryLayout.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace savescan
{

class SnapshotBuffer;

enum class LocateStatus
{
    Found,
    NotFound,
    BufferTooSmall
};

struct LocateResult
{
    LocateStatus status = LocateStatus::NotFound;
    std::optional<MemoryLayout> layout;

    bool Found() const { return status == LocateStatus::Found && layout.has_value(); }
};

/// Per-strategy counters, indexed by LocatorStrategyKind
struct LocatorStats
{
    std::array<uint64_t, kLocatorStrategyCount> invocations{};
    std::array<uint64_t, kLocatorStrategyCount> successes{};

    uint64_t Invocations(LocatorStrategyKind kind) const { return invocations[static_cast<size_t>(kind)]; }
    uint64_t Successes(LocatorStrategyKind kind) const { return successes[static_cast<size_t>(kind)]; }

    void Reset()
    {
        invocations.fill(0);
        successes.fill(0);
    }
};

/**
 * @brief Ordered fallback chain of locator strategies
 *
 * Strategies run in registration order and the first validated layout
 * wins. An unrecognized buffer is an ordinary NotFound result.
 *
 * Not thread-safe; callers serialize access (the engine does so through
 * its snapshot cache lock).
 */
class MemoryLocator
{
public:
    using StrategyObserver = std::function<void(LocatorStrategyKind, bool)>;

    // Smallest buffer that can hold both regions
    static constexpr size_t kMinimumSnapshotSize = AddressTable::kRegionA.size + AddressTable::kRegionB.size;

    explicit MemoryLocator(const LocatorCreateInfo& create_info = {});
    ~MemoryLocator();

    MemoryLocator(const MemoryLocator&) = delete;
    MemoryLocator& operator=(const MemoryLocator&) = delete;

    /**
     * @brief Register the default chain: header magic, known offsets,
     *        pointer-pair sweep (if enabled), title signature
     */
    void RegisterDefaultStrategies();

    bool RegisterStrategy(std::unique_ptr<ILocatorStrategy> strategy);

    void RemoveAllStrategies();

    size_t StrategyCount() const { return strategies_.size(); }

    LocateResult Locate(const uint8_t* data, size_t size);
    LocateResult Locate(const SnapshotBuffer& snapshot);

    const LocatorStats& Stats() const { return stats_; }
    void ResetStats() { stats_.Reset(); }

    /// Called after every strategy attempt with its outcome
    void SetStrategyObserver(StrategyObserver observer) { observer_ = std::move(observer); }

    static const char* GetStrategyName(LocatorStrategyKind kind);

private:
    std::vector<std::unique_ptr<ILocatorStrategy>> strategies_;
    LocatorCreateInfo create_info_;
    LocatorStats stats_;
    StrategyObserver observer_;
};

} // namespace savescan
