#include <gtest/gtest.h>
#include <sdc/fanout/event_stream.hpp>

#include <chrono>
#include <thread>
#include <variant>
#include <vector>

using namespace sdc::schema;

TEST(event_stream, delivers_events_in_publish_order) {
  auto stream = sdc::fanout::event_stream{};
  stream.publish(record_batch_t{.dc = "a", .records = {}});
  stream.publish(failure_t{.error = dc_error_t{.dc = "b"}});
  stream.publish(done_t{});
  EXPECT_TRUE(stream.completed());

  EXPECT_EQ(std::get<record_batch_t>(stream.next()).dc, "a");
  EXPECT_EQ(std::get<failure_t>(stream.next()).error.dc, "b");
  EXPECT_TRUE(is_done(stream.next()));
}

TEST(event_stream, reads_after_done_keep_returning_done) {
  auto stream = sdc::fanout::event_stream{};
  stream.publish(done_t{});
  EXPECT_TRUE(is_done(stream.next()));
  EXPECT_TRUE(is_done(stream.next()));
  auto again = stream.next_for(std::chrono::milliseconds{1});
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(is_done(*again));
}

TEST(event_stream, next_for_times_out_when_idle) {
  auto stream = sdc::fanout::event_stream{};
  EXPECT_FALSE(stream.next_for(std::chrono::milliseconds{10}).has_value());
  EXPECT_FALSE(stream.completed());
}

TEST(event_stream, next_blocks_until_a_producer_publishes) {
  auto stream = sdc::fanout::event_stream{};
  auto producer = std::jthread([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    stream.publish(record_batch_t{.dc = "late", .records = {}});
  });
  EXPECT_EQ(std::get<record_batch_t>(stream.next()).dc, "late");
}

TEST(event_stream, concurrent_producers_lose_nothing) {
  auto stream = sdc::fanout::event_stream{};
  constexpr auto kProducers = 8;
  constexpr auto kPerProducer = 50;
  {
    auto producers = std::vector<std::jthread>{};
    for (auto p = 0; p < kProducers; ++p) {
      producers.emplace_back([&stream, p] {
        for (auto i = 0; i < kPerProducer; ++i) {
          stream.publish(record_batch_t{.dc = std::to_string(p), .records = {}});
        }
      });
    }
  }
  stream.publish(done_t{});
  auto seen = 0;
  while (!is_done(stream.next())) {
    ++seen;
  }
  EXPECT_EQ(seen, kProducers * kPerProducer);
}
