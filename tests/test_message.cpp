/**
 * @file test_message.cpp
 * @brief Tests for message.hpp, marshal.hpp and value.hpp without a bus.
 */

#include <catch2/catch_test_macros.hpp>
#include "ebus/call.hpp"
#include "ebus/marshal.hpp"
#include "ebus/message.hpp"
#include "ebus/value.hpp"

#include <cstdint>
#include <string>

using ebus::Value;
using ebus::ValueList;

// ============================================================================
// Value
// ============================================================================

TEST_CASE("value - integers compare numerically across signedness", "[value]") {
  REQUIRE(Value(42) == Value(42U));
  REQUIRE(Value(int64_t{7}) == Value(uint8_t{7}));
  REQUIRE(Value(-1) != Value(UINT64_MAX));
  REQUIRE(Value(1) != Value(true));
  REQUIRE(Value(1) != Value(1.0));
}

TEST_CASE("value - kinds and accessors", "[value]") {
  REQUIRE(Value().IsNone());
  REQUIRE(Value(true).AsBool());
  REQUIRE(Value(-5).AsInt() == -5);
  REQUIRE(Value(2.5).AsDouble() == 2.5);
  REQUIRE(Value("text").AsString() == "text");
  REQUIRE(Value(std::string("s")).kind() == Value::Kind::kString);

  const Value v = Value::MakeVariant("as", Value::MakeList({Value("a")}));
  REQUIRE(v.kind() == Value::Kind::kVariant);
  REQUIRE(v.VariantSignature() == "as");
  REQUIRE(v.VariantValue().AsList().size() == 1U);
  REQUIRE(Value(3).VariantValue().IsNone());

  const Value d = Value::MakeDict({{Value("k"), Value(1)}});
  REQUIRE(d.ToString() == "{\"k\": 1}");
}

// ============================================================================
// Argument checking
// ============================================================================

TEST_CASE("marshal - CheckArgs accepts matching shapes", "[marshal]") {
  REQUIRE(ebus::CheckArgs("", {}).has_value());
  REQUIRE(ebus::CheckArgs("is", {Value(1), Value("x")}).has_value());
  REQUIRE(ebus::CheckArgs("y", {Value(255)}).has_value());
  REQUIRE(ebus::CheckArgs("d", {Value(3)}).has_value());
  REQUIRE(ebus::CheckArgs("o", {Value("/a/b")}).has_value());
  REQUIRE(ebus::CheckArgs("a{sv}", {Value::MakeDict({{Value("k"),
                                     Value::MakeVariant("i", Value(1))}})})
              .has_value());
  REQUIRE(ebus::CheckArgs("(ias)", {Value::MakeList(
                                       {Value(1), Value::MakeList({})})})
              .has_value());
}

TEST_CASE("marshal - CheckArgs rejects mismatches", "[marshal]") {
  auto bad_sig = ebus::CheckArgs("(i", {Value(1)});
  REQUIRE_FALSE(bad_sig.has_value());
  REQUIRE(bad_sig.get_error().Is(ebus::errors::kInvalidSignature));

  const auto invalid = [](const std::string& sig, const ValueList& args) {
    auto r = ebus::CheckArgs(sig, args);
    return !r.has_value() && r.get_error().Is(ebus::errors::kInvalidArgs);
  };
  REQUIRE(invalid("i", {}));
  REQUIRE(invalid("i", {Value(1), Value(2)}));
  REQUIRE(invalid("", {Value(1)}));
  REQUIRE(invalid("y", {Value(256)}));
  REQUIRE(invalid("u", {Value(-1)}));
  REQUIRE(invalid("n", {Value(40000)}));
  REQUIRE(invalid("s", {Value(1)}));
  REQUIRE(invalid("o", {Value("not a path")}));
  REQUIRE(invalid("as", {Value("flat")}));
  REQUIRE(invalid("(is)", {Value::MakeList({Value(1)})}));
  REQUIRE(invalid("v", {Value(1)}));
  REQUIRE(invalid("v", {Value::MakeVariant("ii", Value(1))}));
}

// ============================================================================
// Messages
// ============================================================================

TEST_CASE("message - factories validate names", "[message]") {
  REQUIRE(ebus::Message::MethodCall("", "/a", "org.ebus.A", "Get").has_value());
  REQUIRE_FALSE(ebus::Message::MethodCall("", "a", "org.ebus.A", "Get").has_value());
  REQUIRE_FALSE(
      ebus::Message::MethodCall("", "/a", "noDots", "Get").has_value());
  REQUIRE_FALSE(
      ebus::Message::MethodCall("", "/a", "org.ebus.A", "Bad.Member").has_value());
  REQUIRE_FALSE(
      ebus::Message::MethodCall("not a name", "/a", "", "Get").has_value());
  REQUIRE_FALSE(ebus::Message::Signal("/a", "", "Changed").has_value());

  auto call = ebus::Message::MethodCall("", "/a", "", "Get");
  REQUIRE(call.has_value());
  REQUIRE(call.value().Interface().empty());
  REQUIRE_FALSE(
      ebus::Message::ErrorReply(call.value(), "bad", "x").has_value());
}

TEST_CASE("message - headers and payload", "[message]") {
  auto call = ebus::Message::MethodCall("org.ebus.Peer", "/a/b", "org.ebus.A",
                                        "Get");
  REQUIRE(call.has_value());
  ebus::Message m = call.value();
  REQUIRE(m.Type() == ebus::MessageType::kMethodCall);
  REQUIRE(std::string(ebus::MessageTypeName(m.Type())) == "method_call");
  REQUIRE(m.Destination() == "org.ebus.Peer");
  REQUIRE(m.Path() == "/a/b");
  REQUIRE(m.Member() == "Get");
  REQUIRE_FALSE(m.NoReply());
  m.SetNoReply(true);
  REQUIRE(m.NoReply());
  REQUIRE(m.AutoStart());
  m.SetAutoStart(false);
  REQUIRE_FALSE(m.AutoStart());
  REQUIRE_FALSE(ebus::Message().AutoStart());

  REQUIRE(m.SetArgs("sai", {Value("x"), Value::MakeList({Value(1), Value(2)})})
              .has_value());
  REQUIRE(m.Signature() == "sai");
  const ValueList args = m.Args();
  REQUIRE(args.size() == 2U);
  REQUIRE(args[0] == Value("x"));
  REQUIRE(args[1] == Value::MakeList({Value(1), Value(2)}));

  // Failed validation leaves the body untouched.
  REQUIRE_FALSE(m.SetArgs("i", {Value("no")}).has_value());
  REQUIRE(m.Signature() == "sai");

  ebus::Message copy = m;
  REQUIRE(copy.raw() == m.raw());
}

TEST_CASE("message - local errors convert to call results", "[message]") {
  auto err = ebus::Message::LocalError(ebus::errors::kNoReply, "timed out", 9U);
  REQUIRE(err.Type() == ebus::MessageType::kError);
  REQUIRE(err.ReplySerial() == 9U);
  REQUIRE(err.ErrorText() == "timed out");

  auto r = ebus::ReplyToResult(err);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error().IsTimeout());
  REQUIRE(r.get_error().message == "timed out");

  auto empty = ebus::ReplyToResult(ebus::Message());
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.get_error().Is(ebus::errors::kNoMemory));
}

TEST_CASE("call - SplitMember", "[call]") {
  std::string iface;
  std::string member;
  ebus::SplitMember("org.ebus.A.Get", iface, member);
  REQUIRE(iface == "org.ebus.A");
  REQUIRE(member == "Get");

  iface = "org.ebus.B";
  ebus::SplitMember("Get", iface, member);
  REQUIRE(iface == "org.ebus.B");
  REQUIRE(member == "Get");

  iface.clear();
  ebus::SplitMember("Plain", iface, member);
  REQUIRE(iface.empty());
  REQUIRE(member == "Plain");
}
