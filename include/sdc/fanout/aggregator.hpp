#pragma once

#include <sdc/client/datacenter_client.hpp>
#include <sdc/fanout/event_stream.hpp>
#include <sdc/schema/event.hpp>
#include <sdc/schema/machine_query.hpp>
#include <sdc/schema/primitives.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace sdc::fanout {

namespace detail {

/// State shared by the units of one run, its deadline watchdog and its
/// consumer.
struct run_state final {
  explicit run_state(sdc::schema::datacenter_list_t dcs);

  /// Report the outcome of datacenter `index`.
  ///
  /// Only the first report per datacenter is published; later ones return
  /// false. The report that resolves the last outstanding datacenter also
  /// publishes done_t.
  bool settle(std::size_t index, sdc::schema::event_t outcome);

  /// Resolve every still-outstanding datacenter as a timeout.
  void expire(const std::string& reason);

  /// Publish done_t and wake everybody waiting for completion.
  void complete();

  const sdc::schema::datacenter_list_t datacenters;
  event_stream stream;
  std::atomic<std::size_t> outstanding;
  std::vector<std::atomic<bool>> settled;
  std::mutex completion_mutex;
  std::condition_variable_any completion;
  bool completed{false};
};

}  // namespace detail

struct run_options final {
  /// Global deadline across all datacenters; none by default.
  std::optional<std::chrono::milliseconds> deadline;
};

/// Consumer side of one fan-out run.
///
/// A run has exactly one consumer: either blocking iteration through next()
/// or a single subscribe() listener. Destroying the handle joins every
/// worker thread of the run.
class run_handle final {
 public:
  using listener_t = std::function<void(const sdc::schema::event_t&)>;

  explicit run_handle(sdc::schema::datacenter_list_t dcs);
  run_handle(const run_handle&) = delete;
  run_handle& operator=(const run_handle&) = delete;
  ~run_handle() = default;

  /// Number of datacenters queried by this run.
  std::size_t size() const;

  /// Datacenters queried by this run, in launch order.
  const sdc::schema::datacenter_list_t& datacenters() const;

  /// Blocking iteration; throws std::logic_error when subscribed.
  sdc::schema::event_t next();
  std::optional<sdc::schema::event_t> next_for(
      std::chrono::milliseconds timeout);

  /// Deliver every event, done_t last, to `listener` on a dispatch thread.
  ///
  /// Throws std::logic_error when the run already has a consumer.
  void subscribe(listener_t listener);

  /// Block until done_t has been published and, when subscribed, delivered.
  void wait();

 private:
  friend class aggregator;

  void claim_iteration();

  std::shared_ptr<detail::run_state> state_;
  std::atomic<bool> iterating_{false};
  std::atomic<bool> subscribed_{false};
  // Destroyed in reverse order: dispatcher first, workers last.
  std::vector<std::jthread> units_;
  std::jthread watchdog_;
  std::jthread dispatcher_;
};

/// Concurrent machine listing across datacenters.
///
/// Every start() launches one worker per datacenter calling the per-DC
/// client, and returns immediately. The aggregator keeps no state between
/// runs.
class aggregator final {
 public:
  explicit aggregator(sdc::client::datacenter_call_t call);

  /// Start one run of `query` against every datacenter in `dcs`.
  ///
  /// Throws precondition_error(invalid_query) before any worker starts when
  /// the query is malformed. An empty `dcs` yields a run that is already
  /// complete.
  std::unique_ptr<run_handle> start(
      const std::set<sdc::schema::datacenter_id_t>& dcs,
      const sdc::schema::list_machines_query_t& query,
      const run_options& options = {}) const;

 private:
  sdc::client::datacenter_call_t call_;
};

}  // namespace sdc::fanout
