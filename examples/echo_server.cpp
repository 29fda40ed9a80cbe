#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include <pthread.h>

namespace {

auto parse_backend(std::string_view s) -> std::optional<strata::runtime_backend> {
  for (auto b : {strata::runtime_backend::single_thread, strata::runtime_backend::thread_per_core,
                 strata::runtime_backend::work_stealing}) {
    if (s == strata::to_string(b)) {
      return b;
    }
  }
  return std::nullopt;
}

/// Line echo with per-connection back-pressure.
auto make_pipeline(std::shared_ptr<strata::stats_counters> counters) {
  auto echo = strata::make_service<strata::buffer_view>(
    [](strata::buffer_view line) -> strata::awaitable<strata::result<strata::buffer_view>> {
      co_return line;
    });
  return strata::pipeline{strata::clone_factory{std::move(echo)}}
    .apply(strata::in_flight_limit{64})
    .apply(strata::stats_layer{std::move(counters)});
}

}  // namespace

int main(int argc, char* argv[]) {
  std::uint16_t port = 55555;
  strata::runtime_config rt_cfg{};
  if (argc >= 2) {
    port = static_cast<std::uint16_t>(std::stoi(argv[1]));
  }
  if (argc >= 3) {
    auto b = parse_backend(argv[2]);
    if (!b) {
      std::cerr << "echo_server: unknown backend: " << argv[2] << "\n";
      return 1;
    }
    rt_cfg.backend = *b;
  }
  if (argc >= 4) {
    rt_cfg.threads = static_cast<std::size_t>(std::stoul(argv[3]));
  }

  auto rt = strata::runtime::create(rt_cfg);
  if (!rt) {
    std::cerr << "echo_server: " << rt.error().message() << "\n";
    return 1;
  }
  strata::log::set_level(spdlog::level::info);

  // Signals are taken by the waiter thread below.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  strata::server_config cfg{};
  cfg.listen = strata::address{"127.0.0.1", port};
  cfg.dispatcher.keepalive_timeout = std::chrono::seconds{60};

  auto counters = std::make_shared<strata::stats_counters>();
  strata::server srv{**rt, cfg, strata::line_codec{}, make_pipeline(counters)};
  if (auto ec = srv.start()) {
    std::cerr << "echo_server: start failed: " << ec.message() << "\n";
    return 1;
  }
  std::cout << "echo_server: listening on " << srv.local_endpoint()->to_string() << " ("
            << strata::to_string(rt_cfg.backend) << ")\n";

  std::thread waiter{[&] {
    int sig = 0;
    sigwait(&signals, &sig);
    std::cout << "echo_server: signal " << sig << ", draining "
              << srv.counter().open() << " connection(s)\n";
    srv.stop();
    auto const deadline = std::chrono::steady_clock::now() + cfg.dispatcher.shutdown_timeout;
    while (srv.counter().open() != 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
    (*rt)->stop();
  }};

  (*rt)->run();
  waiter.join();
  (*rt)->join();

  std::cout << "echo_server: served " << counters->requests.load() << " request(s), "
            << srv.counter().accepted() << " connection(s)\n";
  return 0;
}
