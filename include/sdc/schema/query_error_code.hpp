#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sdc::schema {

enum class query_error_code : uint32_t {
  invalid_query = 1,
  empty_dc_set = 2,
};

/// Raised synchronously, before any datacenter is contacted, when a run
/// cannot start.
class precondition_error final : public std::runtime_error {
 public:
  precondition_error(query_error_code code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  query_error_code code() const noexcept { return code_; }

 private:
  query_error_code code_;
};

}  // namespace sdc::schema
