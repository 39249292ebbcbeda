#pragma once

#include "../pattern/Pattern.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace savescan
{

struct TitleSignature
{
    std::string name;
    Pattern pattern;
    // Distance from the start of the state header to the signature
    size_t header_offset;
};

/**
 * @brief Compiled-in facts about the save state container format
 */
class Signatures
{
public:
    // Region offsets measured from the start of the state header
    static constexpr size_t kRegionBOffset = 0x19000;
    static constexpr size_t kRegionAOffset = 0x21000;

    static constexpr uint32_t kHeaderMagicBase = 0x01000000;
    static constexpr uint32_t kMaxKnownVersion = 9;

    static const std::vector<uint32_t>& GetHeaderMagicTags();

    // Matches any tag in GetHeaderMagicTags(); hits still need IsHeaderMagic()
    static const Pattern& GetHeaderMagicPattern();

    static bool IsHeaderMagic(uint32_t value);

    static const std::vector<size_t>& GetKnownHeaderOffsets();

    static const std::vector<TitleSignature>& GetTitleSignatures();

    static const TitleSignature* GetTitleSignature(const std::string& name);
};

} // namespace savescan
