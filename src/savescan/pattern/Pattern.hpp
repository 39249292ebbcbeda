#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace savescan
{

struct Pattern
{
    std::vector<uint8_t> bytes;
    std::vector<bool> mask;

    // "07 00 00 01", "?? 00 00 01"; "??", "." and ".." are wildcards
    static Pattern FromString(const std::string& pattern_str);

    static Pattern FromBytes(const uint8_t* data, size_t size);

    static Pattern FromAscii(std::string_view text);

    size_t Size() const { return bytes.size(); }

    bool IsValid() const { return !bytes.empty() && bytes.size() == mask.size(); }

    bool HasWildcards() const;
};

} // namespace savescan
