#include <spdlog/spdlog.h>
#include <sdc/common/critical.hpp>
#include <sdc/fanout/aggregator.hpp>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace sdc::schema;

namespace {

event_t make_failure(const datacenter_id_t& dc,
                     const dc_error_kind kind,
                     std::string message) {
  return failure_t{
      .error = dc_error_t{.dc = dc, .kind = kind, .message = std::move(message)}};
}

// Any exception escaping the per-DC client is that datacenter's failure.
event_t run_unit(const sdc::client::datacenter_call_t& call,
                 const datacenter_id_t& dc,
                 const list_machines_query_t& query) {
  try {
    auto result = call(dc, query);
    return std::visit(
        overloaded{[&](std::vector<machine_t>& machines) -> event_t {
                     auto batch = record_batch_t{.dc = dc};
                     batch.records.reserve(machines.size());
                     for (auto& machine : machines) {
                       batch.records.push_back(machine_record_t{
                           .dc = dc, .machine = std::move(machine)});
                     }
                     return batch;
                   },
                   [&](client_error_t& error) -> event_t {
                     return failure_t{.error = tag_error(dc, error)};
                   }},
        result);
  } catch (const std::exception& ex) {
    return make_failure(dc, dc_error_kind::internal_fault, ex.what());
  } catch (...) {
    return make_failure(dc, dc_error_kind::internal_fault,
                        "unknown exception in datacenter client");
  }
}

void log_outcome(const event_t& outcome) {
  std::visit(overloaded{[](const record_batch_t& batch) {
                          spdlog::debug("dc {} returned {} machine(s)",
                                        batch.dc, batch.records.size());
                        },
                        [](const failure_t& failure) {
                          spdlog::warn("dc {} failed ({}): {}",
                                       failure.error.dc,
                                       to_string(failure.error.kind),
                                       failure.error.message);
                        },
                        [](const done_t&) {}},
             outcome);
}

}  // namespace

namespace sdc::fanout {

namespace detail {

run_state::run_state(datacenter_list_t dcs)
    : datacenters(std::move(dcs)),
      outstanding(datacenters.size()),
      settled(datacenters.size()) {}

bool run_state::settle(const std::size_t index, event_t outcome) {
  auto expected = false;
  if (!settled[index].compare_exchange_strong(expected, true,
                                              std::memory_order_acq_rel)) {
    return false;
  }
  log_outcome(outcome);
  stream.publish(std::move(outcome));

  // The outcome is published before the decrement, so whoever takes the
  // counter to zero publishes done_t after every outcome.
  auto previous = outstanding.fetch_sub(1, std::memory_order_acq_rel);
  if (previous == 0) {
    sdc::common::critical("fan-out outstanding counter underflow");
  }
  if (previous == 1) {
    complete();
  }
  return true;
}

void run_state::expire(const std::string& reason) {
  for (auto index = std::size_t{0}; index < datacenters.size(); ++index) {
    if (settle(index, make_failure(datacenters[index], dc_error_kind::timeout,
                                   reason))) {
      spdlog::warn("dc {} did not answer before the deadline",
                   datacenters[index]);
    }
  }
}

void run_state::complete() {
  stream.publish(done_t{});
  {
    auto lock = std::scoped_lock{completion_mutex};
    completed = true;
  }
  completion.notify_all();
}

}  // namespace detail

run_handle::run_handle(datacenter_list_t dcs)
    : state_(std::make_shared<detail::run_state>(std::move(dcs))) {}

std::size_t run_handle::size() const {
  return state_->datacenters.size();
}

const datacenter_list_t& run_handle::datacenters() const {
  return state_->datacenters;
}

event_t run_handle::next() {
  claim_iteration();
  return state_->stream.next();
}

std::optional<event_t> run_handle::next_for(
    const std::chrono::milliseconds timeout) {
  claim_iteration();
  return state_->stream.next_for(timeout);
}

void run_handle::subscribe(listener_t listener) {
  if (iterating_.load() || subscribed_.exchange(true)) {
    throw std::logic_error("fan-out run already has a consumer");
  }
  dispatcher_ = std::jthread([state = state_, listener = std::move(listener)] {
    auto done = false;
    while (!done) {
      auto event = state->stream.next();
      done = is_done(event);
      try {
        listener(event);
      } catch (const std::exception& ex) {
        spdlog::error("fan-out listener failed: {}", ex.what());
      } catch (...) {
        spdlog::error("fan-out listener failed with an unknown exception");
      }
    }
  });
}

void run_handle::wait() {
  {
    auto lock = std::unique_lock{state_->completion_mutex};
    state_->completion.wait(lock, [&] { return state_->completed; });
  }
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
}

void run_handle::claim_iteration() {
  if (subscribed_.load()) {
    throw std::logic_error("fan-out run is consumed by a subscriber");
  }
  iterating_.store(true);
}

aggregator::aggregator(sdc::client::datacenter_call_t call)
    : call_(std::move(call)) {
  if (!call_) {
    sdc::common::critical("fan-out aggregator requires a datacenter client");
  }
}

std::unique_ptr<run_handle> aggregator::start(
    const std::set<datacenter_id_t>& dcs,
    const list_machines_query_t& query,
    const run_options& options) const {
  if (auto reason = validate_query(query)) {
    throw precondition_error(query_error_code::invalid_query, *reason);
  }

  auto run = std::make_unique<run_handle>(
      datacenter_list_t{std::begin(dcs), std::end(dcs)});
  auto state = run->state_;
  if (state->datacenters.empty()) {
    spdlog::debug("fan-out started with no datacenters");
    state->complete();
    return run;
  }

  spdlog::debug("fan-out to {} datacenter(s)", state->datacenters.size());
  auto shared_query = std::make_shared<const list_machines_query_t>(query);
  run->units_.reserve(state->datacenters.size());
  for (auto index = std::size_t{0}; index < state->datacenters.size();
       ++index) {
    try {
      run->units_.emplace_back([state, call = call_, shared_query, index] {
        const auto& dc = state->datacenters[index];
        auto outcome = run_unit(call, dc, *shared_query);
        if (!state->settle(index, std::move(outcome))) {
          spdlog::debug("late outcome from dc {} discarded", dc);
        }
      });
    } catch (const std::system_error& ex) {
      static_cast<void>(state->settle(
          index, make_failure(state->datacenters[index],
                              dc_error_kind::internal_fault,
                              std::string{"failed to start worker: "} +
                                  ex.what())));
    }
  }

  if (options.deadline) {
    auto deadline = std::chrono::steady_clock::now() + *options.deadline;
    auto reason = "global deadline of " +
                  std::to_string(options.deadline->count()) + " ms exceeded";
    run->watchdog_ = std::jthread(
        [state, deadline, reason = std::move(reason)](std::stop_token stop) {
          auto lock = std::unique_lock{state->completion_mutex};
          auto finished = state->completion.wait_until(
              lock, stop, deadline, [&] { return state->completed; });
          if (finished || stop.stop_requested()) {
            return;
          }
          lock.unlock();
          state->expire(reason);
        });
  }
  return run;
}

}  // namespace sdc::fanout
