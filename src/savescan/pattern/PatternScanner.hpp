#pragma once

#include "Pattern.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace savescan
{

/**
 * @brief Byte-pattern search over an in-memory snapshot
 *
 * Exact patterns use Boyer-Moore-Horspool; patterns containing wildcards
 * are matched at every offset.
 */
class PatternScanner
{
public:
    static std::optional<size_t> Find(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern);

    /// Every match offset in ascending order, overlapping matches included
    static std::vector<size_t> FindAll(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern);

    static bool MatchesAt(const uint8_t* buffer, size_t buffer_size, size_t offset, const Pattern& pattern);

private:
    static std::vector<size_t> BuildSkipTable(const Pattern& pattern);

    static void ScanExact(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern, bool first_only,
                          std::vector<size_t>& hits);
    static void ScanMasked(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern, bool first_only,
                           std::vector<size_t>& hits);
};

} // namespace savescan
