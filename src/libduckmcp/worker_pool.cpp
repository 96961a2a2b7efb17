#include "duckmcp/worker_pool.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

#include "duckmcp/logger.hpp"

namespace duckmcp {

void worker_pool::launch(int fd, std::function<void(int)> work) {
  std::lock_guard<std::mutex> lock{mutex_};
  reap();

  // The duplicate pins the socket until the worker is done with it.
  int watch = ::dup(fd);
  if (watch < 0)
    LOG_WARN("cannot watch connection fd {}: {}", fd, std::strerror(errno));
  else
    watched_fds_.insert(watch);

  ++active_;
  auto finished = std::make_shared<std::atomic<bool>>(false);
  workers_.push_back(
      {std::thread{[this, fd, watch, work = std::move(work), finished]() {
         try {
           work(fd);
         } catch (const std::exception& e) {
           LOG_ERROR("connection worker failed: {}", e.what());
         }
         if (watch >= 0) {
           std::lock_guard<std::mutex> lock{mutex_};
           watched_fds_.erase(watch);
           ::close(watch);
         }
         --active_;
         *finished = true;
       }},
       finished});
}

void worker_pool::shutdown_all() {
  std::lock_guard<std::mutex> lock{mutex_};
  for (int fd : watched_fds_) ::shutdown(fd, SHUT_RDWR);
}

void worker_pool::join() {
  std::list<worker> workers;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    workers.swap(workers_);
  }
  for (auto& w : workers)
    if (w.thread.joinable()) w.thread.join();
}

void worker_pool::reap() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (*it->finished) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace duckmcp
