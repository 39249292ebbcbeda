#include "HeaderMagicStrategy.hpp"
#include "../pattern/PatternScanner.hpp"
#include "../signatures/Signatures.hpp"

namespace savescan
{

std::optional<MemoryLayout> HeaderMagicStrategy::OnLocate(const uint8_t* data, size_t size)
{
    const auto hits = PatternScanner::FindAll(data, size, Signatures::GetHeaderMagicPattern());

    for (size_t offset : hits)
    {
        auto tag = ReadLe32(data, size, offset);
        if (!tag || !Signatures::IsHeaderMagic(*tag))
            continue;

        if (auto layout = ValidateAtHeader(data, size, offset))
            return layout;
    }
    return std::nullopt;
}

} // namespace savescan
