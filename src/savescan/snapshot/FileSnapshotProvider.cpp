#include "FileSnapshotProvider.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace savescan
{

FileSnapshotProvider::FileSnapshotProvider(std::filesystem::path path)
    : path_(std::move(path))
{
}

std::optional<SnapshotBuffer> FileSnapshotProvider::CaptureSnapshot()
{
    last_error_.clear();

    std::error_code ec;
    auto file_size = std::filesystem::file_size(path_, ec);
    if (ec)
    {
        last_error_ = "Cannot stat " + path_.string() + ": " + ec.message();
        return std::nullopt;
    }
    if (file_size == 0 || file_size > kMaxSnapshotBytes)
    {
        last_error_ = "Unexpected snapshot size " + std::to_string(file_size) + " for " + path_.string();
        return std::nullopt;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open())
    {
        last_error_ = "Cannot open " + path_.string();
        return std::nullopt;
    }

    std::vector<uint8_t> bytes(static_cast<size_t>(file_size));
    if (!in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size())))
    {
        last_error_ = "Short read from " + path_.string();
        return std::nullopt;
    }

    uint64_t id = SnapshotBuffer::ContentHash(bytes.data(), bytes.size());
    return SnapshotBuffer(std::move(bytes), id);
}

} // namespace savescan
