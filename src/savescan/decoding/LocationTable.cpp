#include "LocationTable.hpp"

#include <unordered_map>

namespace savescan
{
namespace
{
const std::unordered_map<std::string, std::string_view>& Table()
{
    static const std::unordered_map<std::string, std::string_view> table = []
    {
        std::unordered_map<std::string, std::string_view> t = {
            // Towns and cities
            { "3:0", "Pallet Town" },
            { "3:1", "Viridian City" },
            { "3:2", "Pewter City" },
            { "3:3", "Cerulean City" },
            { "3:4", "Lavender Town" },
            { "3:5", "Vermilion City" },
            { "3:6", "Celadon City" },
            { "3:7", "Fuchsia City" },
            { "3:8", "Cinnabar Island" },
            { "3:9", "Indigo Plateau" },
            { "3:10", "Saffron City" },
            // Sevii Islands
            { "3:12", "One Island" },
            { "3:13", "Two Island" },
            { "3:14", "Three Island" },
            { "3:15", "Four Island" },
            { "3:16", "Five Island" },
            { "3:17", "Seven Island" },
            { "3:18", "Six Island" },
            // Pallet Town interiors
            { "4:0", "Player's House 1F" },
            { "4:1", "Player's House 2F" },
            { "4:2", "Rival's House" },
            { "4:3", "Oak's Lab" },
            // Dungeons
            { "1:0", "Viridian Forest" },
            { "1:1", "Mt. Moon 1F" },
            { "1:2", "Mt. Moon B1F" },
            { "1:3", "Mt. Moon B2F" },
        };

        static constexpr std::string_view kRoutes[] = {
            "Route 1",  "Route 2",  "Route 3",  "Route 4",  "Route 5",  "Route 6",  "Route 7",
            "Route 8",  "Route 9",  "Route 10", "Route 11", "Route 12", "Route 13", "Route 14",
            "Route 15", "Route 16", "Route 17", "Route 18", "Route 19", "Route 20", "Route 21",
            "Route 22", "Route 23", "Route 24", "Route 25",
        };
        uint8_t number = 19;
        for (auto route : kRoutes)
            t.emplace(LocationTable::MakeKey(3, number++), route);

        return t;
    }();
    return table;
}
} // namespace

std::string LocationTable::MakeKey(uint8_t group, uint8_t number)
{
    return std::to_string(group) + ":" + std::to_string(number);
}

std::optional<std::string_view> LocationTable::Lookup(uint8_t group, uint8_t number)
{
    const auto& table = Table();
    auto it = table.find(MakeKey(group, number));
    if (it == table.end())
        return std::nullopt;
    return it->second;
}

std::string LocationTable::Describe(uint8_t group, uint8_t number)
{
    if (auto name = Lookup(group, number))
        return std::string(*name);
    return "Map " + std::to_string(group) + "-" + std::to_string(number);
}

size_t LocationTable::Size() { return Table().size(); }

} // namespace savescan
