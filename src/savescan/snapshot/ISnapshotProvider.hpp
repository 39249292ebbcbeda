#pragma once

#include "SnapshotBuffer.hpp"

#include <optional>

namespace savescan
{

/**
 * @brief Source of emulator snapshots
 *
 * The only capability the engine needs from the emulator. Each call returns
 * a fresh, independent capture; std::nullopt means no snapshot is available
 * right now.
 */
class ISnapshotProvider
{
public:
    virtual ~ISnapshotProvider() = default;

    virtual std::optional<SnapshotBuffer> CaptureSnapshot() = 0;
};

} // namespace savescan
