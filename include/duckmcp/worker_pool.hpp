#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace duckmcp {

/** @brief One thread per connection, at most `limit` alive at a time.
 *
 * Each worker gets the connection descriptor and owns it.  The pool
 * keeps a duplicate of every live descriptor until its worker returns,
 * so shutdown_all() only ever reaches sockets that workers still hold.
 */
class worker_pool {
 public:
  explicit worker_pool(int limit) : limit_{limit} {}
  worker_pool(const worker_pool&) = delete;
  worker_pool& operator=(const worker_pool&) = delete;
  worker_pool(worker_pool&&) = delete;
  worker_pool& operator=(worker_pool&&) = delete;
  ~worker_pool() { join(); }

  [[nodiscard]] bool full() const { return active_.load() >= limit_; }
  [[nodiscard]] int active() const { return active_.load(); }

  void launch(int fd, std::function<void(int)> work);

  // Wake workers blocked on their sockets so they can finish.
  void shutdown_all();

  void join();

 private:
  struct worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  // Caller holds mutex_.
  void reap();

  int limit_;
  std::atomic<int> active_{0};
  std::mutex mutex_;
  std::set<int> watched_fds_;
  std::list<worker> workers_;
};

}  // namespace duckmcp
