#include "savescan.hpp"

#include "../cache/SnapshotCache.hpp"
#include "../decoding/DomainDecoder.hpp"
#include "../memory/VirtualMemoryReader.hpp"
#include "../scanning/LocatorCreateInfo.hpp"
#include "../scanning/MemoryLocator.hpp"
#include "../snapshot/ISnapshotProvider.hpp"
#include "../snapshot/SnapshotBuffer.hpp"
#include "../util/Profile.hpp"

#include <mutex>
#include <sstream>

namespace savescan
{

struct Engine::Impl
{
    Config cfg{};
    Logger log{};

    std::unique_ptr<MemoryLocator> locator;
    std::unique_ptr<SnapshotCache> cache;
    ErrorContext errors;

    mutable std::mutex error_mutex;
    std::string last_error_message;

    void set_error(const std::string& msg)
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error_message = msg;
    }

    void rebuild()
    {
        LocatorCreateInfo create_info;
        create_info.logger = log;
        create_info.verbose = cfg.verbose;
        create_info.enable_full_scan = cfg.enable_full_scan;

        locator = std::make_unique<MemoryLocator>(create_info);
        locator->RegisterDefaultStrategies();
        cache = std::make_unique<SnapshotCache>(cfg.cache_ttl, cfg.not_found_ttl);
    }
};

Engine::Engine()
    : impl_(std::make_unique<Impl>())
{
    impl_->rebuild();
}

Engine::~Engine() noexcept = default;

bool Engine::initialize(const Config& cfg, Logger loggers)
{
    impl_->cfg = cfg;
    impl_->log = std::move(loggers);

#if SAVESCAN_PROFILING_LEVEL >= 1
    profiling::SetProfilingLogger(&impl_->log);
#endif

    impl_->rebuild();

    if (impl_->log.info)
    {
        std::ostringstream oss;
        oss << "savescan engine initialized (cache_ttl=" << cfg.cache_ttl.count()
            << "ms, not_found_ttl=" << cfg.not_found_ttl.count()
            << "ms, full_scan=" << (cfg.enable_full_scan ? "on" : "off") << ")";
        impl_->log.info(oss.str());
    }
    return true;
}

ExtractionResult Engine::extract(const SnapshotBuffer& snapshot)
{
    return extract(snapshot.data(), snapshot.size(), snapshot.capture_id());
}

ExtractionResult Engine::extract(const SnapshotBuffer& snapshot, std::uint64_t snapshot_id)
{
    return extract(snapshot.data(), snapshot.size(), snapshot_id);
}

ExtractionResult Engine::extract(const std::uint8_t* data, std::size_t size, std::uint64_t snapshot_id)
{
    PROFILE_SCOPE_FUNCTION();

    ExtractionResult result;

    auto cached = impl_->cache->GetOrLocate(snapshot_id,
                                            [this, data, size] { return impl_->locator->Locate(data, size); });
    result.from_cache = cached.from_cache;

    if (!cached.result.Found())
    {
        result.status = ExtractStatus::LayoutNotFound;
        if (!cached.from_cache)
        {
            std::ostringstream oss;
            oss << "Memory layout not found in snapshot " << snapshot_id << " (" << size << " bytes)";
            impl_->set_error(oss.str());
            if (impl_->log.warn)
                impl_->log.warn(oss.str());
            impl_->errors.ReportWarning("Memory layout not found",
                                        cached.result.status == LocateStatus::BufferTooSmall ? "snapshot too small" :
                                                                                                "no strategy matched");
        }
        return result;
    }

    result.layout = cached.result.layout;
    VirtualMemoryReader reader(data, size, *result.layout);
    DomainDecoder decoder(reader, impl_->log);
    result.telemetry = decoder.Decode();
    result.status = ExtractStatus::Ok;
    return result;
}

ExtractionResult Engine::capture_and_extract(ISnapshotProvider& provider)
{
    auto snapshot = provider.CaptureSnapshot();
    if (!snapshot || snapshot->empty())
    {
        impl_->set_error("Snapshot capture failed");
        if (impl_->log.error)
            impl_->log.error("Snapshot capture failed");
        impl_->errors.ReportError("Snapshot capture failed");

        ExtractionResult result;
        result.status = ExtractStatus::CaptureFailed;
        return result;
    }

    return extract(*snapshot);
}

void Engine::invalidate_cache() { impl_->cache->Invalidate(); }

void Engine::set_error_callback(ErrorCallback callback) { impl_->errors.SetCallback(std::move(callback)); }

std::string Engine::last_error() const
{
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error_message;
}

const Config& Engine::config() const { return impl_->cfg; }

LocatorStats Engine::locator_stats() const { return impl_->locator->Stats(); }

} // namespace savescan
