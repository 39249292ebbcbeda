#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace savescan
{

/**
 * @brief Immutable bytes of one emulator snapshot
 *
 * Move-only so a capture is handed from provider to engine without
 * accidental copies.
 */
class SnapshotBuffer
{
public:
    SnapshotBuffer() = default;
    SnapshotBuffer(std::vector<uint8_t> bytes, uint64_t capture_id);

    SnapshotBuffer(const SnapshotBuffer&) = delete;
    SnapshotBuffer& operator=(const SnapshotBuffer&) = delete;
    SnapshotBuffer(SnapshotBuffer&&) = default;
    SnapshotBuffer& operator=(SnapshotBuffer&&) = default;

    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    /// Identity used as the layout cache key
    uint64_t capture_id() const { return capture_id_; }

    /// 64-bit FNV-1a over the bytes
    static uint64_t ContentHash(const uint8_t* data, size_t size);

private:
    std::vector<uint8_t> bytes_;
    uint64_t capture_id_ = 0;
};

} // namespace savescan
