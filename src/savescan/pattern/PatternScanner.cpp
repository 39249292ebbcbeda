#include "PatternScanner.hpp"

#include "../util/Profile.hpp"

#include <cstring>

namespace savescan
{

std::vector<size_t> PatternScanner::BuildSkipTable(const Pattern& pattern)
{
    const size_t n = pattern.Size();
    std::vector<size_t> skip(256, n);
    for (size_t i = 0; i + 1 < n; ++i)
        skip[pattern.bytes[i]] = n - 1 - i;
    return skip;
}

bool PatternScanner::MatchesAt(const uint8_t* buffer, size_t buffer_size, size_t offset, const Pattern& pattern)
{
    if (!buffer || !pattern.IsValid() || offset > buffer_size || buffer_size - offset < pattern.Size())
        return false;

    for (size_t j = 0; j < pattern.Size(); ++j)
    {
        if (pattern.mask[j] && buffer[offset + j] != pattern.bytes[j])
            return false;
    }
    return true;
}

void PatternScanner::ScanExact(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern, bool first_only,
                               std::vector<size_t>& hits)
{
    const size_t n = pattern.Size();
    const auto skip = BuildSkipTable(pattern);
    const uint8_t last = pattern.bytes[n - 1];

    size_t i = 0;
    while (i <= buffer_size - n)
    {
        const uint8_t tail = buffer[i + n - 1];
        if (tail == last && std::memcmp(buffer + i, pattern.bytes.data(), n - 1) == 0)
        {
            hits.push_back(i);
            if (first_only)
                return;
            ++i;
            continue;
        }
        i += skip[tail];
    }
}

void PatternScanner::ScanMasked(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern, bool first_only,
                                std::vector<size_t>& hits)
{
    for (size_t i = 0; i <= buffer_size - pattern.Size(); ++i)
    {
        if (!MatchesAt(buffer, buffer_size, i, pattern))
            continue;

        hits.push_back(i);
        if (first_only)
            return;
    }
}

std::optional<size_t> PatternScanner::Find(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern)
{
    PROFILE_SCOPE_FUNCTION();
    if (buffer == nullptr || !pattern.IsValid() || buffer_size < pattern.Size())
        return std::nullopt;

    std::vector<size_t> hits;
    if (pattern.HasWildcards())
        ScanMasked(buffer, buffer_size, pattern, true, hits);
    else
        ScanExact(buffer, buffer_size, pattern, true, hits);

    if (hits.empty())
        return std::nullopt;
    return hits.front();
}

std::vector<size_t> PatternScanner::FindAll(const uint8_t* buffer, size_t buffer_size, const Pattern& pattern)
{
    PROFILE_SCOPE_FUNCTION();
    std::vector<size_t> hits;
    if (buffer == nullptr || !pattern.IsValid() || buffer_size < pattern.Size())
        return hits;

    if (pattern.HasWildcards())
    {
        PROFILE_SCOPE_CUSTOM("PatternScanner.MaskedScan");
        ScanMasked(buffer, buffer_size, pattern, false, hits);
    }
    else
    {
        ScanExact(buffer, buffer_size, pattern, false, hits);
    }
    return hits;
}

} // namespace savescan
