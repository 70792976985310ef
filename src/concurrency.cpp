#include "concurrency.h"

#include "tbb/task_arena.h"
#include "tbb/task_group.h"

#include <algorithm>
#include <exception>
#include <mutex>
#include <stdexcept>

namespace bale {

void run_bounded(std::size_t count,
                 int limit,
                 std::stop_token outer,
                 std::function<void(std::size_t, std::stop_token)> const &fn) {
  if (count == 0) { return; }

  std::stop_source stop;
  std::stop_callback const forward{ outer, [&stop] { stop.request_stop(); } };

  std::mutex mutex;
  std::exception_ptr first_error;

  tbb::task_arena arena{ std::max(1, limit) };
  arena.execute([&] {
    tbb::task_group tg;
    for (std::size_t i{ 0 }; i < count; ++i) {
      tg.run([&, i] {
        if (stop.stop_requested()) { return; }
        try {
          fn(i, stop.get_token());
        } catch (std::exception const &) {
          std::lock_guard const lock{ mutex };
          if (!first_error) { first_error = std::current_exception(); }
          stop.request_stop();
        }
      });
    }
    tg.wait();
  });

  if (first_error) { std::rethrow_exception(first_error); }
  if (outer.stop_requested()) { throw std::runtime_error("operation cancelled"); }
}

}  // namespace bale
