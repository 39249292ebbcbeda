#pragma once

#include "ISnapshotProvider.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace savescan
{

/**
 * @brief Reads a save state file from disk on every capture
 *
 * Capture ids are content hashes, so re-reading an unchanged file maps to
 * the same cache entry.
 */
class FileSnapshotProvider : public ISnapshotProvider
{
public:
    explicit FileSnapshotProvider(std::filesystem::path path);
    ~FileSnapshotProvider() override = default;

    std::optional<SnapshotBuffer> CaptureSnapshot() override;

    const std::filesystem::path& path() const { return path_; }
    const std::string& last_error() const { return last_error_; }

private:
    static constexpr std::uintmax_t kMaxSnapshotBytes = 16u * 1024u * 1024u;

    std::filesystem::path path_;
    std::string last_error_;
};

} // namespace savescan
