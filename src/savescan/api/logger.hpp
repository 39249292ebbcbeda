#pragma once

#include <functional>
#include <string>

namespace savescan
{

struct Logger
{
    std::function<void(const std::string&)> info;
    std::function<void(const std::string&)> debug;
    std::function<void(const std::string&)> warn;
    std::function<void(const std::string&)> error;
};

} // namespace savescan
