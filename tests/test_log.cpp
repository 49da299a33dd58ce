/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "ebus/log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

namespace {

struct Record {
  ebus::log::Level level;
  std::string category;
  std::string message;
  int line;
};

void CaptureSink(ebus::log::Level level, const char* category,
                 const char* message, const char* /*file*/, int line,
                 void* ctx) {
  static_cast<std::vector<Record>*>(ctx)->push_back(
      Record{level, category, message, line});
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(ebus::log::GetLevel() == ebus::log::Level::kInfo);
#else
  REQUIRE(ebus::log::GetLevel() == ebus::log::Level::kDebug);
#endif
}

TEST_CASE("Log SetLevel", "[log]") {
  auto prev = ebus::log::GetLevel();
  ebus::log::SetLevel(ebus::log::Level::kError);
  REQUIRE(ebus::log::GetLevel() == ebus::log::Level::kError);
  REQUIRE_FALSE(ebus::log::IsEnabled(ebus::log::Level::kWarn));
  REQUIRE(ebus::log::IsEnabled(ebus::log::Level::kFatal));
  ebus::log::SetLevel(prev);
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  REQUIRE(!ebus::log::IsInitialized());
  ebus::log::Init();
  REQUIRE(ebus::log::IsInitialized());
  ebus::log::Shutdown();
  REQUIRE(!ebus::log::IsInitialized());
}

TEST_CASE("Log sink receives formatted records", "[log]") {
  std::vector<Record> records;
  ebus::log::SetLevel(ebus::log::Level::kDebug);
  ebus::log::SetSink(&CaptureSink, &records);

  EBUS_LOG_DEBUG("conn", "debug %d", 1);
  EBUS_LOG_INFO("router", "info %s", "msg");
  EBUS_LOG_WARN("loop", "warn");
  EBUS_LOG_ERROR("server", "error %d %d", 1, 2);

  ebus::log::SetSink(nullptr);
  REQUIRE(records.size() == 4U);
  REQUIRE(records[0].level == ebus::log::Level::kDebug);
  REQUIRE(records[0].category == "conn");
  REQUIRE(records[0].message == "debug 1");
  REQUIRE(records[1].message == "info msg");
  REQUIRE(records[2].level == ebus::log::Level::kWarn);
  REQUIRE(records[3].category == "server");
  REQUIRE(records[3].message == "error 1 2");
  REQUIRE(records[3].line > 0);
}

TEST_CASE("Log runtime level filtering", "[log]") {
  std::vector<Record> records;
  ebus::log::SetSink(&CaptureSink, &records);

  ebus::log::SetLevel(ebus::log::Level::kWarn);
  EBUS_LOG_DEBUG("test", "dropped");
  EBUS_LOG_INFO("test", "dropped");
  EBUS_LOG_WARN("test", "kept");

  ebus::log::SetLevel(ebus::log::Level::kOff);
  EBUS_LOG_ERROR("test", "dropped");

  ebus::log::SetLevel(ebus::log::Level::kDebug);
  ebus::log::SetSink(nullptr);
  REQUIRE(records.size() == 1U);
  REQUIRE(records[0].message == "kept");
}

TEST_CASE("Log long messages are truncated", "[log]") {
  std::vector<Record> records;
  ebus::log::SetLevel(ebus::log::Level::kDebug);
  ebus::log::SetSink(&CaptureSink, &records);
  const std::string big(EBUS_LOG_MESSAGE_MAX * 2U, 'x');
  EBUS_LOG_INFO("test", "%s", big.c_str());
  ebus::log::SetSink(nullptr);
  REQUIRE(records.size() == 1U);
  REQUIRE(records[0].message.size() == EBUS_LOG_MESSAGE_MAX - 1U);
}

TEST_CASE("Log default sink writes without crashing", "[log]") {
  ebus::log::SetSink(nullptr);
  ebus::log::SetLevel(ebus::log::Level::kDebug);
  for (int i = 0; i < 10; ++i) {
    EBUS_LOG_DEBUG("test", "sequence %d", i);
  }
  REQUIRE(true);
}
