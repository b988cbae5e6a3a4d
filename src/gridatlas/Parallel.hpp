#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace gridatlas {

// Resolve a requested worker count: <=0 means hardware concurrency, and never
// more workers than tasks.
inline int ResolveThreadCount(int requested, int tasks)
{
  int threads = requested;
  if (threads <= 0) threads = static_cast<int>(std::thread::hardware_concurrency());
  if (threads <= 0) threads = 1;
  return std::max(1, std::min(threads, tasks));
}

// Run fn(i) for i in [0, total). Workers pull indices from a shared atomic
// counter; callers write results into per-index slots so the output never
// depends on scheduling. The first exception thrown by fn stops the remaining
// work and is rethrown on the calling thread once every worker has joined.
inline void ParallelForIndex(int total, int threads, const std::function<void(int)>& fn)
{
  if (total <= 0) return;
  threads = ResolveThreadCount(threads, total);

  if (threads <= 1) {
    for (int i = 0; i < total; ++i) fn(i);
    return;
  }

  std::atomic<int> nextIndex{0};
  std::mutex errorMutex;
  std::exception_ptr firstError;
  auto stopWith = [&](std::exception_ptr e) {
    nextIndex.store(total);
    std::lock_guard<std::mutex> lock(errorMutex);
    if (!firstError) firstError = e;
  };

  auto worker = [&]() {
    for (;;) {
      const int i = nextIndex.fetch_add(1);
      if (i >= total) break;
      try {
        fn(i);
      } catch (...) {
        stopWith(std::current_exception());
        break;
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(threads));
  try {
    for (int t = 0; t < threads; ++t) pool.emplace_back(worker);
  } catch (...) {
    // Thread creation failed: stop the started workers and report it.
    stopWith(std::current_exception());
  }
  for (std::thread& th : pool) {
    if (th.joinable()) th.join();
  }

  if (firstError) std::rethrow_exception(firstError);
}

} // namespace gridatlas
