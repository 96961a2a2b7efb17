#include <doctest/doctest.h>

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <stdexcept>

#include "duckmcp/worker_pool.hpp"

using duckmcp::worker_pool;

TEST_CASE("worker-pool-shutdown-wakes-blocked-workers") {
  int pair[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, pair) == 0);

  worker_pool pool{2};
  std::atomic<long> got{-2};
  pool.launch(pair[0], [&got](int fd) {
    char c{};
    got = ::read(fd, &c, 1);
    ::close(fd);
  });
  CHECK(pool.active() == 1);

  pool.shutdown_all();
  pool.join();
  CHECK(got.load() == 0);
  CHECK(pool.active() == 0);
  ::close(pair[1]);
}

TEST_CASE("worker-pool-shutdown-spares-recycled-descriptors") {
  int first[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, first) == 0);

  // The worker closes its descriptor, opens a fresh pair that may reuse
  // the number, and asks for a shutdown before it returns.
  worker_pool pool{2};
  int fresh[2]{-1, -1};
  std::atomic<bool> opened{false};
  pool.launch(first[0], [&](int fd) {
    ::close(fd);
    opened = ::socketpair(AF_UNIX, SOCK_STREAM, 0, fresh) == 0;
    pool.shutdown_all();
  });
  pool.join();
  REQUIRE(opened.load());

  char out{'x'};
  char in{};
  CHECK(::write(fresh[1], &out, 1) == 1);
  CHECK(::read(fresh[0], &in, 1) == 1);
  CHECK(in == 'x');

  ::close(fresh[0]);
  ::close(fresh[1]);
  ::close(first[1]);
}

TEST_CASE("worker-pool-survives-throwing-work") {
  int pair[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, pair) == 0);

  worker_pool pool{1};
  pool.launch(pair[0], [](int fd) {
    ::close(fd);
    throw std::runtime_error{"handler failed"};
  });
  pool.join();
  CHECK(pool.active() == 0);
  CHECK_FALSE(pool.full());
  ::close(pair[1]);
}
