#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace savescan
{

/**
 * @brief Static map of (map group, map number) to place names
 */
class LocationTable
{
public:
    /// Compound key in "group:number" form
    static std::string MakeKey(uint8_t group, uint8_t number);

    static std::optional<std::string_view> Lookup(uint8_t group, uint8_t number);

    /// Place name, or "Map {group}-{number}" for pairs not in the table
    static std::string Describe(uint8_t group, uint8_t number);

    static size_t Size();
};

} // namespace savescan
