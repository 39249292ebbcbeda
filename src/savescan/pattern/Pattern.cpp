#include "Pattern.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace savescan
{

Pattern Pattern::FromString(const std::string& pattern_str)
{
    Pattern pattern;
    std::istringstream iss(pattern_str);
    std::string token;

    while (iss >> token)
    {
        if (token == "??" || token == "." || token == "..")
        {
            pattern.bytes.push_back(0x00);
            pattern.mask.push_back(false);
            continue;
        }

        if (token.size() > 2 || !std::all_of(token.begin(), token.end(),
                                             [](unsigned char c)
                                             {
                                                 return std::isxdigit(c) != 0;
                                             }))
        {
            return Pattern();
        }

        pattern.bytes.push_back(static_cast<uint8_t>(std::stoul(token, nullptr, 16)));
        pattern.mask.push_back(true);
    }

    return pattern;
}

Pattern Pattern::FromBytes(const uint8_t* data, size_t size)
{
    Pattern pattern;
    pattern.bytes.assign(data, data + size);
    pattern.mask.assign(size, true);
    return pattern;
}

Pattern Pattern::FromAscii(std::string_view text)
{
    return FromBytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool Pattern::HasWildcards() const { return std::find(mask.begin(), mask.end(), false) != mask.end(); }

} // namespace savescan
