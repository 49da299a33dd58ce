/**
 * @file call.hpp
 * @brief Method call request description and reply conversion.
 */

#ifndef EBUS_CALL_HPP_
#define EBUS_CALL_HPP_

#include "ebus/error.hpp"
#include "ebus/message.hpp"
#include "ebus/value.hpp"
#include "ebus/vocabulary.hpp"

#include <functional>
#include <string>
#include <utility>

namespace ebus {

/**
 * @brief Everything needed to issue one method call.
 *
 * `member` may carry its interface as "org.example.Iface.Method" when
 * `interface` is left empty.
 */
struct CallRequest {
  std::string destination;
  std::string path;
  std::string member;
  std::string interface;
  std::string signature;
  ValueList args;
};

/** @brief Receives the reply, the synthetic timeout error, or a local error. */
using ReplyCallback = std::function<void(Message reply)>;

/**
 * @brief Splits "iface.Member" into its parts when @p interface is empty.
 *
 * A name without a dot is returned unchanged as the member.
 */
inline void SplitMember(const std::string& qualified, std::string& interface,
                        std::string& member) {
  member = qualified;
  if (!interface.empty()) return;
  const auto dot = qualified.rfind('.');
  if (dot == std::string::npos) return;
  interface = qualified.substr(0, dot);
  member = qualified.substr(dot + 1U);
}

/**
 * @brief Converts a reply into the synchronous call result.
 *
 * An error reply becomes an Error carrying its name and first string
 * argument; any other reply yields its arguments.
 */
inline expected<ValueList, Error> ReplyToResult(const Message& reply) {
  if (!reply.IsValid()) {
    return expected<ValueList, Error>::error(NoMemoryError());
  }
  if (reply.Type() == MessageType::kError) {
    return expected<ValueList, Error>::error(
        Error(reply.ErrorName(), reply.ErrorText()));
  }
  return expected<ValueList, Error>::success(reply.Args());
}

}  // namespace ebus

#endif  // EBUS_CALL_HPP_
