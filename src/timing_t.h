#ifndef TIMING_T
#define TIMING_T

#include <chrono>

namespace Timing {

using namespace std::chrono_literals;

constexpr auto InputSleep   = 5ms;
constexpr auto QueueWait    = 50ms;
constexpr auto SizeCache    = 500ms;
constexpr auto InputTimeout = 10ms;
} // namespace Timing

#endif
