#include "KnownOffsetStrategy.hpp"
#include "../signatures/Signatures.hpp"

namespace savescan
{

std::optional<MemoryLayout> KnownOffsetStrategy::OnLocate(const uint8_t* data, size_t size)
{
    for (size_t header_offset : Signatures::GetKnownHeaderOffsets())
    {
        if (auto layout = ValidateAtHeader(data, size, header_offset))
            return layout;
    }
    return std::nullopt;
}

} // namespace savescan
