#pragma once

#include <sdc/client/datacenter_client.hpp>
#include <sdc/schema/aggregate_result.hpp>
#include <sdc/schema/machine.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace sdc::testing {

inline sdc::schema::machine_t make_machine(const std::string& id,
                                           const std::string& name = {}) {
  return sdc::schema::machine_t{.id = id,
                                .name = name.empty() ? "vm-" + id : name,
                                .type = "smartmachine",
                                .brand = "joyent",
                                .state = "running",
                                .image = "img-1",
                                .package = "g4-highcpu-1G",
                                .memory = 1024,
                                .disk = 25600,
                                .created = "2026-01-0" + id.substr(0, 1) +
                                           "T00:00:00Z",
                                .updated = "2026-02-01T00:00:00Z",
                                .compute_node = "cn-" + id,
                                .primary_ip = "10.0.0." + id.substr(0, 1),
                                .ips = {"10.0.0." + id.substr(0, 1)}};
}

inline std::vector<sdc::schema::machine_t> make_machines(
    const std::string& prefix,
    const std::size_t count) {
  auto out = std::vector<sdc::schema::machine_t>{};
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(make_machine(std::to_string(i + 1) + prefix));
  }
  return out;
}

/// Per-datacenter canned answers. Datacenters without an entry list nothing.
inline sdc::client::datacenter_call_t make_fixed_call(
    std::map<std::string, sdc::client::list_machines_result_t> results) {
  auto shared = std::make_shared<
      const std::map<std::string, sdc::client::list_machines_result_t>>(
      std::move(results));
  return [shared](const sdc::schema::datacenter_id_t& dc,
                  const sdc::schema::list_machines_query_t&)
             -> sdc::client::list_machines_result_t {
    auto it = shared->find(dc);
    if (it == std::end(*shared)) {
      return std::vector<sdc::schema::machine_t>{};
    }
    return it->second;
  };
}

/// Wraps `call` with a random delay of up to `max_delay`.
inline sdc::client::datacenter_call_t with_random_delay(
    sdc::client::datacenter_call_t call,
    const std::chrono::milliseconds max_delay,
    const uint32_t seed) {
  auto mutex = std::make_shared<std::mutex>();
  auto engine = std::make_shared<std::mt19937>(seed);
  return [call = std::move(call), max_delay, mutex, engine](
             const sdc::schema::datacenter_id_t& dc,
             const sdc::schema::list_machines_query_t& query) {
    auto delay = std::chrono::milliseconds{};
    {
      auto lock = std::scoped_lock{*mutex};
      auto dist = std::uniform_int_distribution<int64_t>{0, max_delay.count()};
      delay = std::chrono::milliseconds{dist(*engine)};
    }
    std::this_thread::sleep_for(delay);
    return call(dc, query);
  };
}

/// Blocks every call until release() is invoked.
class gate final {
 public:
  void release() {
    {
      auto lock = std::scoped_lock{mutex_};
      open_ = true;
    }
    opened_.notify_all();
  }

  void wait() {
    auto lock = std::unique_lock{mutex_};
    opened_.wait(lock, [this] { return open_; });
  }

 private:
  std::mutex mutex_;
  std::condition_variable opened_;
  bool open_{false};
};

/// Records calls so tests can check the fan-out contacted each datacenter
/// exactly once.
class call_log final {
 public:
  void record(const sdc::schema::datacenter_id_t& dc) {
    auto lock = std::scoped_lock{mutex_};
    ++counts_[dc];
  }

  std::map<std::string, int> counts() const {
    auto lock = std::scoped_lock{mutex_};
    return counts_;
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, int> counts_;
};

inline std::vector<std::string> sorted_ids(
    const std::vector<sdc::schema::machine_record_t>& records) {
  auto out = std::vector<std::string>{};
  for (const auto& record : records) {
    out.push_back(record.dc + "/" + record.machine.id);
  }
  std::ranges::sort(out);
  return out;
}

inline std::vector<std::string> sorted(std::vector<std::string> values) {
  std::ranges::sort(values);
  return values;
}

/// A scratch directory removed on destruction.
class temp_dir final {
 public:
  explicit temp_dir(const std::string_view label) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("sdc-" + std::string{label} + "-" + std::to_string(stamp));
    std::filesystem::create_directories(path_);
  }
  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;
  ~temp_dir() {
    auto ec = std::error_code{};
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const { return path_; }

  std::filesystem::path write(const std::string& name,
                              const std::string_view content) const {
    auto file = path_ / name;
    auto out = std::ofstream{file};
    out << content;
    return file;
  }

 private:
  std::filesystem::path path_;
};

inline constexpr auto kSampleConfig = std::string_view{R"({
  "dcs": {
    "us-east-1": "https://us-east-1.api.example.com",
    "us-west-1": "https://us-west-1.api.example.com",
    "eu-ams-1": "https://eu-ams-1.api.example.com"
  },
  "profiles": [
    {"name": "prod", "user": "ops", "keyId": "aa:bb", "dcs": ["us-east-1", "us-west-1"]},
    {"name": "all", "user": "admin", "keyId": "cc:dd"}
  ],
  "profile": "prod"
})"};

}  // namespace sdc::testing
