#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include <boost/asio/io_context.hpp>

namespace rl {

// Simple cancellation handle
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
private:
  std::atomic<bool> flag_{false};
};

// A launched task reports its completion by invoking `done` exactly once.
// Extra calls are ignored.
using PacedTask = std::function<void(int /*index (1-based)*/, std::function<void()> /*done*/)>;

// Launch task(index, done) for index = 1..total on `ioc`, waiting `interval` after each launch.
// Tasks are grouped in batches of `concurrency`: when a batch is full, the next launch waits
// until every task of that batch has called done(). This is a barrier, not a sliding window.
// Stops launching when `cancel` is set. on_finished(launched) runs once, after the last
// launched task completed. Nothing blocks: the caller drives it with ioc.run().
void for_each_index_paced(boost::asio::io_context& ioc,
                          int total,
                          int concurrency,
                          std::chrono::steady_clock::duration interval,
                          PacedTask task,
                          std::function<void(int /*launched*/)> on_finished,
                          const Cancellation* cancel = nullptr);

} // namespace rl
