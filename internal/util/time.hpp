#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace payday::util {

/*
  Time utilities: single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected wherever "now" affects a decision so tests can pin it.
using NowFn = std::function<uint64_t()>;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMs();

} // namespace payday::util
