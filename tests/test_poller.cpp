/**
 * @file test_poller.cpp
 * @brief Tests for poller.hpp
 */

#include "ebus/poller.hpp"

#include <catch2/catch_test_macros.hpp>

#include <unistd.h>

namespace {

struct PipeFds {
  PipeFds() { REQUIRE(::pipe(fd) == 0); }
  ~PipeFds() {
    if (fd[0] >= 0) ::close(fd[0]);
    if (fd[1] >= 0) ::close(fd[1]);
  }
  int fd[2] = {-1, -1};
};

}  // namespace

TEST_CASE("Poller rejects negative fds", "[poller]") {
  ebus::Poller poller;
  auto r = poller.Add(-1, static_cast<uint8_t>(ebus::IoEvent::kReadable));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ebus::PollerError::kInvalidFd);
  REQUIRE(poller.Size() == 0U);
}

TEST_CASE("Poller times out with nothing ready", "[poller]") {
  PipeFds p;
  ebus::Poller poller;
  REQUIRE(poller.Add(p.fd[0], static_cast<uint8_t>(ebus::IoEvent::kReadable))
              .has_value());
  auto n = poller.Wait(10);
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 0U);
  REQUIRE(poller.Result(0).events == 0U);
}

TEST_CASE("Poller reports readable and writable per slot", "[poller]") {
  PipeFds p;
  REQUIRE(::write(p.fd[1], "x", 1) == 1);

  ebus::Poller poller;
  auto rd = poller.Add(p.fd[0], static_cast<uint8_t>(ebus::IoEvent::kReadable));
  auto wr = poller.Add(p.fd[1], static_cast<uint8_t>(ebus::IoEvent::kWritable));
  REQUIRE(rd.has_value());
  REQUIRE(wr.has_value());
  REQUIRE(rd.value() != wr.value());

  auto n = poller.Wait(1000);
  REQUIRE(n.has_value());
  REQUIRE(n.value() == 2U);

  auto r0 = poller.Result(rd.value());
  REQUIRE(r0.fd == p.fd[0]);
  REQUIRE(ebus::HasEvent(r0.events, ebus::IoEvent::kReadable));
  REQUIRE_FALSE(ebus::HasEvent(r0.events, ebus::IoEvent::kWritable));

  auto r1 = poller.Result(wr.value());
  REQUIRE(ebus::HasEvent(r1.events, ebus::IoEvent::kWritable));
}

TEST_CASE("Poller allows the same fd twice", "[poller]") {
  PipeFds p;
  REQUIRE(::write(p.fd[1], "x", 1) == 1);

  ebus::Poller poller;
  auto a = poller.Add(p.fd[0], static_cast<uint8_t>(ebus::IoEvent::kReadable));
  auto b = poller.Add(p.fd[0], static_cast<uint8_t>(ebus::IoEvent::kWritable));
  REQUIRE(poller.Size() == 2U);
  REQUIRE(poller.Wait(1000).has_value());
  REQUIRE(ebus::HasEvent(poller.Result(a.value()).events,
                         ebus::IoEvent::kReadable));
  REQUIRE(poller.Result(b.value()).events == 0U);

  poller.Clear();
  REQUIRE(poller.Size() == 0U);
}

TEST_CASE("Poller reports hangup when the writer closes", "[poller]") {
  PipeFds p;
  ::close(p.fd[1]);
  p.fd[1] = -1;

  ebus::Poller poller;
  REQUIRE(poller.Add(p.fd[0], static_cast<uint8_t>(ebus::IoEvent::kReadable))
              .has_value());
  REQUIRE(poller.Wait(1000).has_value());
  REQUIRE(ebus::HasEvent(poller.Result(0).events, ebus::IoEvent::kHangup));
}

TEST_CASE("IoEvent mask helpers", "[poller]") {
  const uint8_t mask = ebus::IoEvent::kReadable | ebus::IoEvent::kHangup;
  REQUIRE(ebus::HasEvent(mask, ebus::IoEvent::kReadable));
  REQUIRE(ebus::HasEvent(mask, ebus::IoEvent::kHangup));
  REQUIRE_FALSE(ebus::HasEvent(mask, ebus::IoEvent::kWritable));
}
