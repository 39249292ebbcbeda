#pragma once

#include "../api/logger.hpp"

namespace savescan
{

struct LocatorCreateInfo
{
    savescan::Logger logger = {};
    bool verbose = false;

    // When false the O(n) pointer-pair sweep is never registered
    bool enable_full_scan = true;
};

} // namespace savescan
