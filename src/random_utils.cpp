#include "random_utils.hpp"

#include <random>

namespace zeroconf_cpp
{

std::chrono::milliseconds RandomMilliseconds(int min, int max)
{
    thread_local std::random_device rd{};
    thread_local std::mt19937 gen{rd()};
    std::uniform_int_distribution<> uid(min, max);
    return std::chrono::milliseconds(uid(gen));
}

}
