/**
 * @file dispatch.hpp
 * @brief Dispatch driver: run a connection's queued messages to completion.
 */

#ifndef EBUS_DISPATCH_HPP_
#define EBUS_DISPATCH_HPP_

#include "ebus/connection.hpp"

#include <cstdint>

namespace ebus {

/**
 * @brief Dispatch messages one at a time while data remains.
 *
 * Stops when the queue is empty or libdbus needs memory (the next pass
 * retries). Does nothing when called from inside a dispatch of @p conn on
 * the same thread.
 *
 * @return Number of messages dispatched.
 */
inline uint32_t DrainDispatch(Connection& conn) {
  if (conn.IsDispatchingOnThisThread()) return 0U;
  uint32_t count = 0U;
  while (conn.GetDispatchStatus() == DispatchStatus::kDataRemains) {
    const DispatchStatus status = conn.DispatchOne();
    ++count;
    if (status == DispatchStatus::kNeedMemory) {
      EBUS_LOG_WARN("dispatch", "out of memory, %u dispatched", count);
      break;
    }
  }
  return count;
}

}  // namespace ebus

#endif  // EBUS_DISPATCH_HPP_
