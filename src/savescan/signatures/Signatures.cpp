#include "Signatures.hpp"

namespace savescan
{

const std::vector<uint32_t>& Signatures::GetHeaderMagicTags()
{
    static const std::vector<uint32_t> tags = []
    {
        std::vector<uint32_t> out;
        for (uint32_t version = 0; version <= kMaxKnownVersion; ++version)
            out.push_back(kHeaderMagicBase | version);
        return out;
    }();
    return tags;
}

const Pattern& Signatures::GetHeaderMagicPattern()
{
    static const Pattern pattern = Pattern::FromString("?? 00 00 01");
    return pattern;
}

bool Signatures::IsHeaderMagic(uint32_t value)
{
    return (value & 0xFFFFFF00u) == kHeaderMagicBase && (value & 0xFFu) <= kMaxKnownVersion;
}

const std::vector<size_t>& Signatures::GetKnownHeaderOffsets()
{
    // Header positions seen from emulator builds that do not write the magic
    static const std::vector<size_t> offsets = { 0x0, 0x10, 0x40, 0x100, 0x200 };
    return offsets;
}

const std::vector<TitleSignature>& Signatures::GetTitleSignatures()
{
    static const std::vector<TitleSignature> signatures = {
        { "rom_title", Pattern::FromAscii("POKEMON FIRE"), 0x10 },
        { "game_code", Pattern::FromAscii("BPRE"), 0x1C },
    };
    return signatures;
}

const TitleSignature* Signatures::GetTitleSignature(const std::string& name)
{
    for (const auto& signature : GetTitleSignatures())
    {
        if (signature.name == name)
            return &signature;
    }
    return nullptr;
}

} // namespace savescan
