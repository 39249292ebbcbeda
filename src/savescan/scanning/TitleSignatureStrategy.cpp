#include "TitleSignatureStrategy.hpp"
#include "../pattern/PatternScanner.hpp"
#include "../signatures/Signatures.hpp"

namespace savescan
{

std::optional<MemoryLayout> TitleSignatureStrategy::OnLocate(const uint8_t* data, size_t size)
{
    for (const auto& signature : Signatures::GetTitleSignatures())
    {
        for (size_t offset : PatternScanner::FindAll(data, size, signature.pattern))
        {
            if (offset < signature.header_offset)
                continue;

            if (auto layout = ValidateAtHeader(data, size, offset - signature.header_offset))
            {
                LogDebug("Matched title signature: " + signature.name);
                return layout;
            }
        }
    }
    return std::nullopt;
}

} // namespace savescan
