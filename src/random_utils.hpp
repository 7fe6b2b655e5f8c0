#pragma once

#include <chrono>

namespace zeroconf_cpp
{

// Uniformly distributed in [min, max]
std::chrono::milliseconds RandomMilliseconds(int min, int max);

}
