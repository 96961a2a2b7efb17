#include "web_server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <csignal>
#include <exception>

#include "duckmcp/logger.hpp"
#include "duckmcp/worker_pool.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace duckmcp {

namespace {

net::awaitable<void> accept_loop(
    tcp::acceptor& acceptor, worker_pool& pool, service& svc) {
  auto executor{co_await net::this_coro::executor};
  net::steady_timer backoff{executor};

  for (;;) {
    boost::system::error_code ec;
    tcp::socket socket{co_await acceptor.async_accept(
        net::redirect_error(net::use_awaitable, ec))};
    if (ec) {
      if (ec != net::error::operation_aborted)
        LOG_ERROR("accept failed: {}", ec.message());
      co_return;
    }

    // Simple back-pressure: wait until a slot opens.
    while (pool.full() && acceptor.is_open()) {
      backoff.expires_after(std::chrono::milliseconds{5});
      co_await backoff.async_wait(net::use_awaitable);
    }
    if (!acceptor.is_open()) co_return;

    boost::system::error_code ec2;
    auto remote = socket.remote_endpoint(ec2);
    LOG_DEBUG(
        "connection from {}:{}", ec2 ? "?" : remote.address().to_string(),
        ec2 ? 0 : remote.port());
    pool.launch(
        socket.release(), [&svc](int fd) { handle_connection(fd, svc); });
  }
}

}  // namespace

void run_web_server(service& svc) {
  const auto& cfg = svc.config;

  net::io_context ioc;
  tcp::endpoint endpoint{
    net::ip::make_address(cfg.host), static_cast<unsigned short>(cfg.port)};
  tcp::acceptor acceptor{ioc};
  acceptor.open(endpoint.protocol());
  acceptor.set_option(net::socket_base::reuse_address{true});
  acceptor.bind(endpoint);
  acceptor.listen();

  LOG_INFO(
      "{} v{} listening on http://{}:{} ({} workers, {} environment)",
      cfg.app_name, cfg.app_version, cfg.host, cfg.port, cfg.workers,
      cfg.environment);

  worker_pool pool{cfg.workers};
  net::signal_set signals{ioc, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    LOG_INFO("received signal {}, shutting down", signo);
    boost::system::error_code ignored;
    acceptor.close(ignored);
    pool.shutdown_all();
  });

  net::co_spawn(
      ioc, accept_loop(acceptor, pool, svc), [&](std::exception_ptr e) {
        boost::system::error_code ignored;
        signals.cancel(ignored);
        if (!e) return;
        try {
          std::rethrow_exception(e);
        } catch (const std::exception& ex) {
          LOG_ERROR("accept loop failed: {}", ex.what());
        }
      });

  ioc.run();
  pool.join();

  svc.cache.clear();
  LOG_INFO("{} stopped", cfg.app_name);
}

}  // namespace duckmcp
