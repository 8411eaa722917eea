#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace txfeed::util {

/*
  Time utilities: the one place feed timestamps are read.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Parses the ISO-8601 profile emitted by the starknet and spark feeds:
//   YYYY-MM-DD[(T| )HH:MM[:SS[.fff]]][Z|(+|-)HH[:]MM]
// A missing zone designator is read as UTC. Throws MalformedTimestamp.
TimePoint ParseTimestamp(std::string_view text);

// Whole seconds since the epoch, floored (pre-epoch instants round down).
std::int64_t ToUnixSeconds(TimePoint tp);

} // namespace txfeed::util
