/**
 * @file poll_reactor.hpp
 * @brief Standalone poll(2) event loop for bus connections.
 *
 * One iteration (RunOnce):
 *   1. Build the interest set from every enabled watch plus the wake pipe.
 *   2. Poll until the nearest timer expiry, or idle_poll_ms when no timer is
 *      armed (0 when work is already queued).
 *   3. Report readiness to each ready watch.
 *   4. Fire every due timer; a timer is re-armed at expiry + interval before
 *      it is handled, skipping periods that were missed entirely.
 *   5. Drain every attached connection (DrainDispatch).
 *   6. Run tasks queued with Post()/DeferredSpawner().
 *
 * EINTR is retried; any other poll failure ends Run()/RunUntil() with an
 * IOError. Stop(), Post() and Wakeup() may be called from any thread.
 *
 * Blocking calls (Call) run nested iterations until the reply arrives. A
 * handler that blocks on a call over its own connection must be run through
 * DeferredSpawner(), since libdbus cannot dispatch a connection from inside
 * its own dispatch.
 */

#ifndef EBUS_POLL_REACTOR_HPP_
#define EBUS_POLL_REACTOR_HPP_

#include "ebus/call.hpp"
#include "ebus/connection.hpp"
#include "ebus/dispatch.hpp"
#include "ebus/error.hpp"
#include "ebus/event_loop.hpp"
#include "ebus/log.hpp"
#include "ebus/poller.hpp"
#include "ebus/vocabulary.hpp"
#include "ebus/watch.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace ebus {

class PollReactor final : public EventLoop {
 public:
  struct Config {
    /// Poll timeout when no timer is armed.
    int32_t idle_poll_ms = 4000;
  };

  PollReactor() : PollReactor(Config{}) {}

  explicit PollReactor(const Config& cfg) : cfg_(cfg) {
    if (::pipe(wake_fd_) != 0) {
      wake_fd_[0] = -1;
      wake_fd_[1] = -1;
      EBUS_LOG_ERROR("reactor", "wake pipe: %s", std::strerror(errno));
      return;
    }
    for (int fd : wake_fd_) {
      (void)::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
      (void)::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
  }

  ~PollReactor() override {
    for (int fd : wake_fd_) {
      if (fd >= 0) ::close(fd);
    }
  }

  PollReactor(const PollReactor&) = delete;
  PollReactor& operator=(const PollReactor&) = delete;

  bool IsValid() const noexcept { return wake_fd_[0] >= 0; }

  // --- EventLoop ---

  expected<void, Error> AddWatch(Watch& watch) override {
    auto reg = std::make_shared<WatchReg>(&watch);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      watch.Slot() = reg;
      watches_.push_back(std::move(reg));
    }
    WakeFromOtherThread();
    return expected<void, Error>::success();
  }

  void RemoveWatch(Watch& watch) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reg = std::static_pointer_cast<WatchReg>(watch.Slot());
    if (reg == nullptr) return;
    reg->active = false;
    watches_.erase(std::remove(watches_.begin(), watches_.end(), reg),
                   watches_.end());
    watch.Slot().reset();
  }

  void WatchToggled(Watch& /*watch*/) override {
    // The interest set is rebuilt every iteration.
    WakeFromOtherThread();
  }

  expected<void, Error> AddTimeout(Timeout& timeout) override {
    auto reg = std::make_shared<TimerReg>(&timeout);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      timeout.Slot() = reg;
      if (timeout.Enabled()) Arm(reg, SteadyNowUs());
    }
    WakeFromOtherThread();
    return expected<void, Error>::success();
  }

  void RemoveTimeout(Timeout& timeout) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto reg = std::static_pointer_cast<TimerReg>(timeout.Slot());
    if (reg == nullptr) return;
    Disarm(*reg);
    reg->active = false;
    timeout.Slot().reset();
    CompactTimers();
  }

  void TimeoutToggled(Timeout& timeout) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto reg = std::static_pointer_cast<TimerReg>(timeout.Slot());
      if (reg == nullptr) return;
      if (!timeout.Enabled()) {
        Disarm(*reg);
        CompactTimers();
        return;
      }
      if (!reg->armed || reg->interval_ms != timeout.IntervalMs()) {
        Arm(reg, SteadyNowUs());
      }
    }
    WakeFromOtherThread();
  }

  void AttachConnection(Connection& conn) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(connections_.begin(), connections_.end(), &conn) ==
        connections_.end()) {
      connections_.push_back(&conn);
    }
  }

  void DetachConnection(Connection& conn) override {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(
        std::remove(connections_.begin(), connections_.end(), &conn),
        connections_.end());
  }

  void Wakeup(Connection& /*conn*/) override { WakeFromOtherThread(); }

  // --- Running ---

  /** @brief Iterate until Stop(); flushes attached connections on return. */
  expected<void, Error> Run() {
    while (!stop_.load(std::memory_order_acquire)) {
      auto r = RunOnce();
      if (!r) {
        stop_.store(false, std::memory_order_release);
        return r;
      }
    }
    FlushConnections();
    stop_.store(false, std::memory_order_release);
    return expected<void, Error>::success();
  }

  /**
   * @brief Iterate until @p done holds, Stop() is called or @p timeout_ms
   *        elapses (-1: no limit). May be nested.
   */
  expected<void, Error> RunUntil(const std::function<bool()>& done,
                                 int32_t timeout_ms = -1) {
    const uint64_t deadline =
        (timeout_ms >= 0) ? SteadyNowMs() + static_cast<uint64_t>(timeout_ms)
                          : 0U;
    while (!done() && !stop_.load(std::memory_order_acquire)) {
      int32_t wait = -1;
      if (timeout_ms >= 0) {
        const uint64_t now = SteadyNowMs();
        if (now >= deadline) break;
        wait = static_cast<int32_t>(deadline - now);
      }
      auto r = RunOnce(wait);
      if (!r) return r;
    }
    return expected<void, Error>::success();
  }

  expected<void, Error> RunFor(int32_t duration_ms) {
    return RunUntil([] { return false; }, duration_ms);
  }

  /** @brief One iteration, waiting at most @p max_wait_ms (-1: no cap). */
  expected<void, Error> RunOnce(int32_t max_wait_ms = -1) {
    loop_thread_.store(std::this_thread::get_id(), std::memory_order_relaxed);

    std::vector<std::shared_ptr<WatchReg>> ready_set;
    std::vector<uint32_t> slots;
    poller_.Clear();
    int32_t wake_slot = -1;
    if (wake_fd_[0] >= 0) {
      auto s = poller_.Add(wake_fd_[0],
                           static_cast<uint8_t>(IoEvent::kReadable));
      if (s) wake_slot = static_cast<int32_t>(s.value());
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& reg : watches_) {
        const uint8_t flags = reg->watch->Flags();
        if (!reg->watch->Enabled() || flags == 0U) continue;
        auto s = poller_.Add(reg->watch->Fd(), flags);
        if (!s) continue;
        ready_set.push_back(reg);
        slots.push_back(s.value());
      }
    }

    auto n = poller_.Wait(ComputeWait(max_wait_ms));
    if (!n) {
      const int err = errno;
      EBUS_LOG_ERROR("reactor", "poll failed: %s", std::strerror(err));
      return expected<void, Error>::error(
          Error(errors::kIoError, std::string("poll: ") + std::strerror(err)));
    }

    if (n.value() > 0U) {
      if (wake_slot >= 0 &&
          poller_.Result(static_cast<uint32_t>(wake_slot)).events != 0U) {
        DrainWakePipe();
      }
      for (size_t i = 0; i < ready_set.size(); ++i) {
        const uint8_t events = poller_.Result(slots[i]).events;
        if (events == 0U || !ready_set[i]->active) continue;
        ready_set[i]->watch->Handle(events);
      }
    }

    FireDueTimers();
    DrainConnections();
    RunDeferred();
    return expected<void, Error>::success();
  }

  void Stop() {
    stop_.store(true, std::memory_order_release);
    Wake();
  }

  bool StopRequested() const noexcept {
    return stop_.load(std::memory_order_acquire);
  }

  /** @brief Queue @p task to run on the loop thread after the next drain. */
  void Post(std::function<void()> task) {
    {
      std::lock_guard<std::mutex> lock(deferred_mutex_);
      deferred_.push_back(std::move(task));
    }
    Wake();
  }

  /** @brief Spawner that runs handlers after the dispatch pass. */
  Connection::Spawner DeferredSpawner() {
    return [this](Connection::Task task) { Post(std::move(task)); };
  }

  /**
   * @brief Blocking method call: send, then iterate until the reply.
   *
   * A reply of error type is returned as its Error; a timeout yields the
   * NoReply error (Error::IsTimeout()).
   */
  expected<ValueList, Error> Call(Connection& conn, const CallRequest& request,
                                  int32_t timeout_ms = -1) {
    if (conn.IsDispatchingOnThisThread()) {
      return expected<ValueList, Error>::error(
          Error(errors::kFailed,
                "blocking call from inside an inline dispatch; install "
                "DeferredSpawner() on the connection"));
    }
    struct Slot {
      bool done = false;
      Message reply;
    };
    auto slot = std::make_shared<Slot>();
    auto serial = conn.CallMethod(
        request,
        [slot](Message reply) {
          slot->reply = std::move(reply);
          slot->done = true;
        },
        timeout_ms);
    if (!serial) return expected<ValueList, Error>::error(serial.get_error());

    auto r = RunUntil([&slot] { return slot->done; });
    if (!slot->done) {
      (void)conn.CancelCall(serial.value());
      return expected<ValueList, Error>::error(
          r ? Error(errors::kFailed, "reactor stopped before the reply")
            : r.get_error());
    }
    return ReplyToResult(slot->reply);
  }

  size_t WatchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return watches_.size();
  }

  /** @brief Timer heap entries, including ones not yet discarded. */
  size_t TimerQueueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
  }

 private:
  struct WatchReg {
    explicit WatchReg(Watch* w) noexcept : watch(w) {}
    Watch* watch;
    bool active = true;
  };

  struct TimerReg {
    explicit TimerReg(Timeout* t) noexcept : timeout(t) {}
    Timeout* timeout;
    int32_t interval_ms = 0;
    uint64_t generation = 0U;
    bool armed = false;
    bool active = true;
  };

  struct TimerEntry {
    uint64_t expiry_us;
    uint64_t generation;
    std::shared_ptr<TimerReg> reg;
  };

  struct LaterExpiry {
    bool operator()(const TimerEntry& a, const TimerEntry& b) const {
      return a.expiry_us > b.expiry_us;
    }
  };

  using TimerHeap =
      std::priority_queue<TimerEntry, std::vector<TimerEntry>, LaterExpiry>;

  static constexpr size_t kMinCompact = 16U;

  static uint64_t PeriodUs(const TimerReg& reg) noexcept {
    return static_cast<uint64_t>(std::max<int32_t>(reg.interval_ms, 1)) *
           1000U;
  }

  static bool IsCurrent(const TimerEntry& e) noexcept {
    return e.reg->active && e.reg->armed && e.generation == e.reg->generation;
  }

  // Requires mutex_.
  void Arm(const std::shared_ptr<TimerReg>& reg, uint64_t base_us) {
    if (reg->armed) ++stale_timers_;
    reg->interval_ms = reg->timeout->IntervalMs();
    reg->armed = true;
    ++reg->generation;
    timers_.push(TimerEntry{base_us + PeriodUs(*reg), reg->generation, reg});
    CompactTimers();
  }

  // Requires mutex_. The heap entry of a disarmed timer stays until popped.
  void Disarm(TimerReg& reg) {
    if (reg.armed) ++stale_timers_;
    reg.armed = false;
    ++reg.generation;
  }

  // Requires mutex_.
  void PopTimer() {
    if (!IsCurrent(timers_.top()) && stale_timers_ > 0U) --stale_timers_;
    timers_.pop();
  }

  // Requires mutex_. Rebuilds the heap once stale entries outnumber live ones.
  void CompactTimers() {
    if (stale_timers_ < kMinCompact || stale_timers_ * 2U <= timers_.size()) {
      return;
    }
    std::vector<TimerEntry> live;
    live.reserve(timers_.size());
    while (!timers_.empty()) {
      if (IsCurrent(timers_.top())) live.push_back(timers_.top());
      timers_.pop();
    }
    timers_ = TimerHeap(LaterExpiry(), std::move(live));
    stale_timers_ = 0U;
  }

  // Requires mutex_.
  int32_t NextTimerDelayMs() {
    while (!timers_.empty() && !IsCurrent(timers_.top())) PopTimer();
    if (timers_.empty()) return -1;
    const uint64_t now = SteadyNowUs();
    const uint64_t expiry = timers_.top().expiry_us;
    if (expiry <= now) return 0;
    return static_cast<int32_t>((expiry - now + 999U) / 1000U);
  }

  int32_t ComputeWait(int32_t max_wait_ms) {
    int32_t wait = cfg_.idle_poll_ms;
    bool busy = false;
    {
      std::lock_guard<std::mutex> lock(deferred_mutex_);
      busy = !deferred_.empty();
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (Connection* c : connections_) {
        if (c->GetDispatchStatus() == DispatchStatus::kDataRemains) {
          busy = true;
        }
      }
      const int32_t timer = NextTimerDelayMs();
      if (timer >= 0 && (wait < 0 || timer < wait)) wait = timer;
    }
    if (busy) wait = 0;
    if (max_wait_ms >= 0 && (wait < 0 || max_wait_ms < wait)) {
      wait = max_wait_ms;
    }
    return wait;
  }

  void FireDueTimers() {
    std::vector<std::shared_ptr<TimerReg>> due;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const uint64_t now = SteadyNowUs();
      while (!timers_.empty() && timers_.top().expiry_us <= now) {
        TimerEntry e = timers_.top();
        PopTimer();
        if (!IsCurrent(e)) continue;
        const uint64_t period = PeriodUs(*e.reg);
        uint64_t next = e.expiry_us + period;
        if (next <= now) next += ((now - next) / period + 1U) * period;
        timers_.push(TimerEntry{next, e.generation, e.reg});
        due.push_back(std::move(e.reg));
      }
    }
    for (auto& reg : due) {
      if (reg->active && reg->armed) reg->timeout->Handle();
    }
  }

  void DrainConnections() {
    std::vector<Connection*> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = connections_;
    }
    for (Connection* c : snapshot) {
      if (IsAttached(c)) (void)DrainDispatch(*c);
    }
  }

  void FlushConnections() {
    std::vector<Connection*> snapshot;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      snapshot = connections_;
    }
    for (Connection* c : snapshot) {
      if (IsAttached(c)) c->Flush();
    }
  }

  bool IsAttached(Connection* c) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(connections_.begin(), connections_.end(), c) !=
           connections_.end();
  }

  void RunDeferred() {
    std::vector<std::function<void()>> tasks;
    {
      std::lock_guard<std::mutex> lock(deferred_mutex_);
      tasks.swap(deferred_);
    }
    for (auto& task : tasks) task();
  }

  void Wake() noexcept {
    if (wake_fd_[1] < 0) return;
    const uint8_t byte = 1U;
    // EAGAIN means a wakeup is already pending.
    (void)::write(wake_fd_[1], &byte, 1);
  }

  void WakeFromOtherThread() noexcept {
    if (loop_thread_.load(std::memory_order_relaxed) !=
        std::this_thread::get_id()) {
      Wake();
    }
  }

  void DrainWakePipe() noexcept {
    uint8_t buf[64];
    while (::read(wake_fd_[0], buf, sizeof(buf)) > 0) {
    }
  }

  Config cfg_;
  int wake_fd_[2] = {-1, -1};
  Poller poller_;
  std::atomic<bool> stop_{false};
  std::atomic<std::thread::id> loop_thread_{};

  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<WatchReg>> watches_;
  TimerHeap timers_;
  size_t stale_timers_ = 0U;
  std::vector<Connection*> connections_;

  std::mutex deferred_mutex_;
  std::vector<std::function<void()>> deferred_;
};

}  // namespace ebus

#endif  // EBUS_POLL_REACTOR_HPP_
