/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "ebus/error.hpp"
#include "ebus/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <thread>

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = ebus::expected<int, ebus::ConfigError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = ebus::expected<int, ebus::ConfigError>::error(
      ebus::ConfigError::kFileNotFound);
  REQUIRE(!r.has_value());
  REQUIRE(!static_cast<bool>(r));
  REQUIRE(r.get_error() == ebus::ConfigError::kFileNotFound);
  REQUIRE(r.value_or(7) == 7);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = ebus::expected<void, ebus::Error>::success();
  REQUIRE(ok.has_value());

  auto err = ebus::expected<void, ebus::Error>::error(
      ebus::Error(ebus::errors::kFailed, "boom"));
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error().Is(ebus::errors::kFailed));
  REQUIRE(err.get_error().message == "boom");

  ok = err;
  REQUIRE_FALSE(ok.has_value());
}

TEST_CASE("expected with identical value and error types", "[vocabulary][expected]") {
  auto v = ebus::expected<std::string, std::string>::success("value");
  auto e = ebus::expected<std::string, std::string>::error("error");
  REQUIRE(v.has_value());
  REQUIRE(v.value() == "value");
  REQUIRE_FALSE(e.has_value());
  REQUIRE(e.get_error() == "error");
  REQUIRE(e.value_or("fallback") == "fallback");
}

TEST_CASE("expected move-only access", "[vocabulary][expected]") {
  auto r = ebus::expected<std::string, int>::success(std::string(64, 'a'));
  std::string taken = std::move(r).value();
  REQUIRE(taken.size() == 64U);
}

// ============================================================================
// optional<T> tests
// ============================================================================

TEST_CASE("optional alias", "[vocabulary][optional]") {
  ebus::optional<int> none;
  REQUIRE_FALSE(none.has_value());
  ebus::optional<int> some = 3;
  REQUIRE(*some == 3);
}

// ============================================================================
// Clock helpers
// ============================================================================

TEST_CASE("SteadyNow is monotonic", "[vocabulary][clock]") {
  const uint64_t a = ebus::SteadyNowUs();
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  const uint64_t b = ebus::SteadyNowUs();
  REQUIRE(b >= a + 4000U);
  REQUIRE(ebus::SteadyNowMs() >= b / 1000U);
}
