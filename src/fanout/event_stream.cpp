#include <sdc/common/critical.hpp>
#include <sdc/fanout/event_stream.hpp>
#include <utility>

namespace sdc::fanout {

void event_stream::publish(sdc::schema::event_t event) {
  {
    auto lock = std::scoped_lock{mutex_};
    if (done_published_) {
      sdc::common::critical("event published after stream completion");
    }
    done_published_ = sdc::schema::is_done(event);
    pending_.push_back(std::move(event));
  }
  ready_.notify_one();
}

sdc::schema::event_t event_stream::next() {
  auto lock = std::unique_lock{mutex_};
  if (done_delivered_) {
    return sdc::schema::done_t{};
  }
  ready_.wait(lock, [&] { return !pending_.empty(); });
  return pop_locked();
}

std::optional<sdc::schema::event_t> event_stream::next_for(
    const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  if (done_delivered_) {
    return sdc::schema::done_t{};
  }
  if (!ready_.wait_for(lock, timeout, [&] { return !pending_.empty(); })) {
    return std::nullopt;
  }
  return pop_locked();
}

bool event_stream::completed() const {
  auto lock = std::scoped_lock{mutex_};
  return done_published_;
}

sdc::schema::event_t event_stream::pop_locked() {
  auto event = std::move(pending_.front());
  pending_.pop_front();
  if (sdc::schema::is_done(event)) {
    done_delivered_ = true;
  }
  return event;
}

}  // namespace sdc::fanout
