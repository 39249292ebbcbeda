#pragma once

#include "LocatorStrategyBase.hpp"

namespace savescan
{

/**
 * @brief Validates the short list of header offsets seen in builds without a version tag
 */
class KnownOffsetStrategy : public LocatorStrategyBase
{
public:
    explicit KnownOffsetStrategy(const LocatorCreateInfo& create_info)
        : LocatorStrategyBase(create_info)
    {
    }

    LocatorStrategyKind Kind() const override { return LocatorStrategyKind::KnownOffset; }

protected:
    std::optional<MemoryLayout> OnLocate(const uint8_t* data, size_t size) override;
};

} // namespace savescan
