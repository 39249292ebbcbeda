#include "SnapshotBuffer.hpp"

namespace savescan
{

SnapshotBuffer::SnapshotBuffer(std::vector<uint8_t> bytes, uint64_t capture_id)
    : bytes_(std::move(bytes))
    , capture_id_(capture_id)
{
}

uint64_t SnapshotBuffer::ContentHash(const uint8_t* data, size_t size)
{
    constexpr uint64_t kOffsetBasis = 0xCBF29CE484222325ULL;
    constexpr uint64_t kPrime = 0x100000001B3ULL;

    uint64_t hash = kOffsetBasis;
    for (size_t i = 0; i < size; ++i)
    {
        hash ^= data[i];
        hash *= kPrime;
    }
    return hash;
}

} // namespace savescan
