#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>

// Single-slot cache whose entry expires after a per-entry TTL.
// Not thread-safe; wrap it in a lock when shared.
template <typename K, typename V>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = Clock::duration;
    using NowFn = std::function<Clock::time_point()>;

    explicit TtlCache(NowFn now = {}) : now_(std::move(now)) {
        if (!now_) now_ = [] { return Clock::now(); };
    }

    std::size_t size() const { return slot_ ? 1 : 0; }
    std::uint64_t hits() const { return hits_; }
    std::uint64_t misses() const { return misses_; }

    bool get(const K& key, V& out) const {
        if (!slot_ || !(slot_->key == key)) return false;
        if (now_() >= slot_->expires_at) return false;
        out = slot_->value;
        return true;
    }

    // Replaces whatever the slot held
    void put(const K& key, const V& val, Duration ttl) {
        slot_ = Slot{ key, val, now_() + ttl };
    }

    void invalidate() { slot_.reset(); }

    template <typename Fn>
    V getOrCompute(const K& key, Duration ttl, Fn&& fn) {
        return getOrComputeWith(key, [ttl](const V&) { return ttl; }, std::forward<Fn>(fn));
    }

    // ttl_for picks the lifetime from the computed value
    template <typename TtlFor, typename Fn>
    V getOrComputeWith(const K& key, TtlFor&& ttl_for, Fn&& fn) {
        V cached{};
        if (get(key, cached)) {
            ++hits_;
            return cached;
        }
        ++misses_;
        V computed = fn();
        put(key, computed, ttl_for(computed));
        return computed;
    }

private:
    struct Slot {
        K key;
        V value;
        Clock::time_point expires_at;
    };

    NowFn now_;
    std::optional<Slot> slot_;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};
