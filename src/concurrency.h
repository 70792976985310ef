#pragma once

#include <cstddef>
#include <functional>
#include <stop_token>

namespace bale {

// Runs fn(i, stop) for every i in [0, count) on a oneTBB arena of at most
// `limit` threads. The first exception is recorded and stop is requested so
// pending work is skipped; tasks already running drain before the recorded
// exception is rethrown. A stop requested through `outer` cancels the batch
// and raises "operation cancelled" when nothing else failed.
void run_bounded(std::size_t count,
                 int limit,
                 std::stop_token outer,
                 std::function<void(std::size_t, std::stop_token)> const &fn);

}  // namespace bale
