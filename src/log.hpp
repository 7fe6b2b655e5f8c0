#pragma once

#include "zeroconf_cpp/log.hpp"

#include <string_view>

namespace zeroconf_cpp
{

void Log(LogLevel level, std::string_view string);

}
