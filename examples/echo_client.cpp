#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

auto client_once(strata::io_context& ctx, strata::address target, std::vector<std::string> lines)
  -> strata::awaitable<void> {
  auto io = co_await strata::connect(target, std::nullopt, std::chrono::seconds{5});
  if (!io) {
    std::cerr << "echo_client: connect failed: " << io.error().message() << "\n";
    ctx.stop();
    co_return;
  }

  strata::line_codec codec{};
  for (auto const& line : lines) {
    if (auto ec = io->encode(codec, strata::buffer_view::copy_of(std::string_view{line}))) {
      std::cerr << "echo_client: encode failed: " << ec.message() << "\n";
      ctx.stop();
      co_return;
    }
  }

  std::size_t replies = 0;
  while (replies < lines.size()) {
    if (!io->write_buffer().empty()) {
      auto w = io->flush();
      if (!w) {
        std::cerr << "echo_client: write failed: " << w.error().message() << "\n";
        break;
      }
    }

    auto frame = io->decode(codec);
    if (!frame) {
      std::cerr << "echo_client: bad reply: " << frame.error().message() << "\n";
      break;
    }
    if (frame->has_value()) {
      std::cout << "echo_client: received: " << (*frame)->to_string() << "\n";
      ++replies;
      continue;
    }

    auto r = io->fill();
    if (r) {
      continue;
    }
    if (r.error() != strata::error::would_block) {
      std::cerr << "echo_client: read failed: " << r.error().message() << "\n";
      break;
    }
    std::error_code ec{};
    if (io->write_buffer().empty()) {
      ec = co_await io->wait_readable();
    } else {
      ec = co_await io->wait_writable();
    }
    if (ec) {
      std::cerr << "echo_client: wait failed: " << ec.message() << "\n";
      break;
    }
  }
  io->close();
  ctx.stop();
}

}  // namespace

int main(int argc, char* argv[]) {
  auto target = strata::address::parse(argc >= 2 ? argv[1] : "127.0.0.1:55555");
  if (!target) {
    std::cerr << "echo_client: expected host:port\n";
    return 1;
  }

  std::vector<std::string> lines{};
  for (int i = 2; i < argc; ++i) {
    lines.emplace_back(argv[i]);
  }
  if (lines.empty()) {
    lines.emplace_back("ping");
  }

  strata::io_context ctx;
  strata::co_spawn(ctx.get_executor(), client_once(ctx, *target, std::move(lines)),
                   strata::detached);
  ctx.run();
  return 0;
}
