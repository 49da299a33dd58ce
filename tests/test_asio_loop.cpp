/**
 * @file test_asio_loop.cpp
 * @brief Tests for asio_loop.hpp: io_context-driven watches, timers, async
 *        and fiber calls.
 */

#include "peer_fixture.hpp"

#include "ebus/asio_loop.hpp"
#include "ebus/connection.hpp"
#include "ebus/handler.hpp"
#include "ebus/server.hpp"

#include <catch2/catch_test_macros.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <fcntl.h>
#include <unistd.h>

using ebus::Value;
using ebus::ValueList;
using ebus_test::PeerServer;
using ebus_test::Request;

namespace {

constexpr int32_t kWaitMs = 5000;

class PipeWatch final : public ebus::Watch {
 public:
  explicit PipeWatch(int fd) : ebus::Watch(nullptr), fd_(fd) {}

  int32_t Fd() const override { return fd_; }
  uint8_t Flags() const override {
    return static_cast<uint8_t>(ebus::IoEvent::kReadable);
  }
  bool Enabled() const override { return enabled; }
  void Handle(uint8_t /*events*/) override {
    ++handled;
    char buf[16];
    (void)::read(fd_, buf, sizeof(buf));
  }

  bool enabled = true;
  int handled = 0;

 private:
  int fd_;
};

class FakeTimeout final : public ebus::Timeout {
 public:
  explicit FakeTimeout(int32_t interval) : ebus::Timeout(nullptr), interval_ms(interval) {}

  int32_t IntervalMs() const override { return interval_ms; }
  bool Enabled() const override { return enabled; }
  void Handle() override { ++fired; }

  int32_t interval_ms;
  bool enabled = true;
  int fired = 0;
};

/// Runs @p io in slices until @p done or @p timeout_ms.
bool RunUntil(boost::asio::io_context& io, const std::function<bool()>& done,
              int32_t timeout_ms = kWaitMs) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    if (io.stopped()) io.restart();
    (void)io.run_for(std::chrono::milliseconds(10));
  }
  return true;
}

void RunFor(boost::asio::io_context& io, int32_t ms) {
  (void)RunUntil(io, [] { return false; }, ms);
}

std::shared_ptr<ebus::Handler> EchoHandler() {
  auto h = std::make_shared<ebus::Handler>();
  h->Add(ebus::HandlerEntry::Method("Echo", &ebus_test::Echo)
             .Interface(ebus_test::kIface));
  return h;
}

}  // namespace

// ============================================================================
// Watches and timeouts
// ============================================================================

TEST_CASE("asio_loop - readable watch is handled", "[asio_loop]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  PipeWatch w(fds[0]);
  REQUIRE(loop.AddWatch(w).has_value());
  REQUIRE(loop.DescriptorCount() == 1U);

  REQUIRE(::write(fds[1], "x", 1) == 1);
  REQUIRE(RunUntil(io, [&] { return w.handled > 0; }));
  REQUIRE(w.handled == 1);

  loop.RemoveWatch(w);
  REQUIRE(loop.DescriptorCount() == 0U);
  // The descriptor is released, not closed.
  REQUIRE(::fcntl(fds[0], F_GETFD) != -1);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("asio_loop - toggled watch stops and resumes", "[asio_loop]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  PipeWatch w(fds[0]);
  w.enabled = false;
  REQUIRE(loop.AddWatch(w).has_value());
  REQUIRE(::write(fds[1], "x", 1) == 1);
  RunFor(io, 50);
  REQUIRE(w.handled == 0);

  w.enabled = true;
  loop.WatchToggled(w);
  REQUIRE(RunUntil(io, [&] { return w.handled > 0; }));

  loop.RemoveWatch(w);
  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("asio_loop - interval timer fires and can be disabled", "[asio_loop][timer]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  FakeTimeout t(20);
  REQUIRE(loop.AddTimeout(t).has_value());
  REQUIRE(loop.TimerCount() == 1U);

  REQUIRE(RunUntil(io, [&] { return t.fired >= 3; }, 2000));

  t.enabled = false;
  loop.TimeoutToggled(t);
  const int before = t.fired;
  RunFor(io, 80);
  REQUIRE(t.fired == before);

  loop.RemoveTimeout(t);
  REQUIRE(loop.TimerCount() == 0U);
}

TEST_CASE("asio_loop - interval change re-arms the timer", "[asio_loop][timer]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  FakeTimeout t(5000);
  REQUIRE(loop.AddTimeout(t).has_value());
  RunFor(io, 30);
  REQUIRE(t.fired == 0);

  t.interval_ms = 20;
  loop.TimeoutToggled(t);
  const auto start = std::chrono::steady_clock::now();
  REQUIRE(RunUntil(io, [&] { return t.fired > 0; }, 2000));
  REQUIRE(std::chrono::steady_clock::now() - start <
          std::chrono::milliseconds(1000));
  loop.RemoveTimeout(t);
}

// ============================================================================
// Calls
// ============================================================================

TEST_CASE("asio_loop - AsyncCall completes with the reply", "[asio_loop][call]") {
  auto handler = EchoHandler();
  PeerServer server([handler](ebus::PollReactor&, ebus::Connection& conn) {
    conn.AddHandler(handler);
  });

  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  ebus::Connection conn(loop);
  REQUIRE(conn.Open(server.Address(), ebus::OpenMode::kPeer).has_value());

  bool done = false;
  boost::system::error_code result_ec;
  ebus::Message reply;
  loop.AsyncCall(conn, Request("Echo", "s", {Value("async")}), kWaitMs,
                 [&](boost::system::error_code ec, ebus::Message m) {
                   result_ec = ec;
                   reply = std::move(m);
                   done = true;
                 });
  REQUIRE(RunUntil(io, [&] { return done; }));
  REQUIRE_FALSE(result_ec);
  REQUIRE(reply.Type() == ebus::MessageType::kMethodReturn);
  REQUIRE(reply.Args() == ValueList{Value("async")});
  conn.Close();
}

TEST_CASE("asio_loop - AsyncCall on a closed connection reports the failure",
          "[asio_loop][call]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  ebus::Connection conn(loop);

  bool done = false;
  boost::system::error_code result_ec;
  ebus::Message reply;
  loop.AsyncCall(conn, Request("Echo"), kWaitMs,
                 [&](boost::system::error_code ec, ebus::Message m) {
                   result_ec = ec;
                   reply = std::move(m);
                   done = true;
                 });
  // Completion is always posted, never inline.
  REQUIRE_FALSE(done);
  REQUIRE(RunUntil(io, [&] { return done; }));
  REQUIRE(result_ec);
  REQUIRE(reply.Type() == ebus::MessageType::kError);
}

TEST_CASE("asio_loop - fiber Call suspends until the reply", "[asio_loop][call]") {
  auto handler = EchoHandler();
  PeerServer server([handler](ebus::PollReactor&, ebus::Connection& conn) {
    conn.AddHandler(handler);
  });

  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  ebus::Connection conn(loop);
  REQUIRE(conn.Open(server.Address(), ebus::OpenMode::kPeer).has_value());

  bool done = false;
  bool ok = false;
  ValueList values;
  boost::asio::spawn(io, [&](boost::asio::yield_context yield) {
    auto r = loop.Call(conn, Request("Echo", "ai", {Value::MakeList(
                                                        {Value(1), Value(2)})}),
                       kWaitMs, yield);
    ok = r.has_value();
    if (ok) values = r.value();
    done = true;
  });
  REQUIRE(RunUntil(io, [&] { return done; }));
  REQUIRE(ok);
  REQUIRE(values == ValueList{Value::MakeList({Value(1), Value(2)})});

  done = false;
  std::string error_name;
  boost::asio::spawn(io, [&](boost::asio::yield_context yield) {
    auto r = loop.Call(conn, Request("Missing"), kWaitMs, yield);
    if (!r) error_name = r.get_error().name;
    done = true;
  });
  REQUIRE(RunUntil(io, [&] { return done; }));
  REQUIRE(error_name == ebus::errors::kUnknownMethod);
  conn.Close();
}

TEST_CASE("asio_loop - fiberless Call is refused", "[asio_loop][call]") {
  boost::asio::io_context io;
  ebus::AsioLoop loop(io);
  ebus::Connection conn(loop);
  auto r = loop.Call(conn, Request("Echo"));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().Is(ebus::errors::kFailed));
  REQUIRE(r.get_error().message.find("FiberSpawner") != std::string::npos);
}

TEST_CASE("asio_loop - handler under FiberSpawner makes a nested call",
          "[asio_loop][call]") {
  auto echo = EchoHandler();
  PeerServer backend_server([echo](ebus::PollReactor&, ebus::Connection& conn) {
    conn.AddHandler(echo);
  });

  boost::asio::io_context io;
  ebus::AsioLoop loop(io);

  ebus::Connection backend(loop);
  REQUIRE(backend.Open(backend_server.Address(), ebus::OpenMode::kPeer)
              .has_value());

  auto forward = std::make_shared<ebus::Handler>();
  forward->AddMethod("Forward", [&](ebus::MethodContext& ctx) {
    auto r = loop.Call(backend,
                       Request("Echo", ctx.Message().Signature(), ctx.Args()),
                       kWaitMs);
    if (!r) return ebus::MethodResult::error(r.get_error());
    ctx.SetResponse(ctx.Message().Signature(), r.value());
    return ebus::MethodResult::success();
  });

  ebus::Server local(loop);
  REQUIRE(local
              .Listen("unix:tmpdir=/tmp",
                      [&](ebus::Connection& conn) {
                        conn.SetSpawner(loop.FiberSpawner());
                        conn.AddHandler(forward);
                      })
              .has_value());

  ebus::Connection client(loop);
  REQUIRE(client.Open(local.Address(), ebus::OpenMode::kPeer).has_value());

  bool done = false;
  ebus::Message reply;
  loop.AsyncCall(client, Request("Forward", "s", {Value("via")}), kWaitMs,
                 [&](boost::system::error_code, ebus::Message m) {
                   reply = std::move(m);
                   done = true;
                 });
  REQUIRE(RunUntil(io, [&] { return done; }));
  REQUIRE(reply.Type() == ebus::MessageType::kMethodReturn);
  REQUIRE(reply.Args() == ValueList{Value("via")});

  client.Close();
  local.Disconnect();
  backend.Close();
}
