#include "MemoryLocator.hpp"
#include "HeaderMagicStrategy.hpp"
#include "KnownOffsetStrategy.hpp"
#include "PointerPairScanStrategy.hpp"
#include "TitleSignatureStrategy.hpp"
#include "../snapshot/SnapshotBuffer.hpp"
#include "../util/Profile.hpp"

#include <sstream>

namespace savescan
{

MemoryLocator::MemoryLocator(const LocatorCreateInfo& create_info)
    : create_info_(create_info)
{
}

MemoryLocator::~MemoryLocator() = default;

void MemoryLocator::RegisterDefaultStrategies()
{
    RemoveAllStrategies();

    RegisterStrategy(std::make_unique<HeaderMagicStrategy>(create_info_));
    RegisterStrategy(std::make_unique<KnownOffsetStrategy>(create_info_));
    if (create_info_.enable_full_scan)
        RegisterStrategy(std::make_unique<PointerPairScanStrategy>(create_info_));
    RegisterStrategy(std::make_unique<TitleSignatureStrategy>(create_info_));
}

bool MemoryLocator::RegisterStrategy(std::unique_ptr<ILocatorStrategy> strategy)
{
    if (!strategy)
        return false;

    strategies_.push_back(std::move(strategy));
    return true;
}

void MemoryLocator::RemoveAllStrategies() { strategies_.clear(); }

LocateResult MemoryLocator::Locate(const SnapshotBuffer& snapshot) { return Locate(snapshot.data(), snapshot.size()); }

LocateResult MemoryLocator::Locate(const uint8_t* data, size_t size)
{
    PROFILE_SCOPE_FUNCTION();

    LocateResult result;
    if (!data || size < kMinimumSnapshotSize)
    {
        if (create_info_.logger.warn)
        {
            std::ostringstream oss;
            oss << "Snapshot too small to hold working RAM: " << size << " bytes";
            create_info_.logger.warn(oss.str());
        }
        result.status = LocateStatus::BufferTooSmall;
        return result;
    }

    for (const auto& strategy : strategies_)
    {
        const auto kind = strategy->Kind();
        ++stats_.invocations[static_cast<size_t>(kind)];

        auto layout = strategy->Locate(data, size);
        if (observer_)
            observer_(kind, layout.has_value());

        if (layout)
        {
            ++stats_.successes[static_cast<size_t>(kind)];
            result.status = LocateStatus::Found;
            result.layout = layout;
            return result;
        }
    }

    if (create_info_.logger.info)
        create_info_.logger.info("No locator strategy found the working RAM regions");

    result.status = LocateStatus::NotFound;
    return result;
}

const char* MemoryLocator::GetStrategyName(LocatorStrategyKind kind)
{
    switch (kind)
    {
        case LocatorStrategyKind::HeaderMagic:
            return "HeaderMagic";
        case LocatorStrategyKind::KnownOffset:
            return "KnownOffset";
        case LocatorStrategyKind::PointerPairScan:
            return "PointerPairScan";
        case LocatorStrategyKind::TitleSignature:
            return "TitleSignature";
        default:
            return "Unknown";
    }
}

} // namespace savescan
