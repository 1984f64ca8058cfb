#pragma once

#include <sdc/schema/event.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace sdc::fanout {

/// Multi-producer, single-consumer queue of fan-out events.
///
/// Producers publish outcomes concurrently; exactly one done_t closes the
/// stream. Once done_t has been delivered every further read returns done_t.
class event_stream final {
 public:
  /// Thread safe. Publishing after done_t is an invariant violation.
  void publish(sdc::schema::event_t event);

  /// Block until the next event is available.
  sdc::schema::event_t next();

  /// Like next(), but give up after `timeout`.
  std::optional<sdc::schema::event_t> next_for(
      std::chrono::milliseconds timeout);

  /// True once done_t has been published (not necessarily consumed).
  bool completed() const;

 private:
  sdc::schema::event_t pop_locked();

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<sdc::schema::event_t> pending_;
  bool done_published_{false};
  bool done_delivered_{false};
};

}  // namespace sdc::fanout
