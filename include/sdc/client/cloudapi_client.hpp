#pragma once

#include <curl/curl.h>
#include <sdc/client/datacenter_client.hpp>
#include <sdc/schema/dc_error.hpp>
#include <sdc/schema/primitives.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace sdc::client {

struct cloudapi_options final {
  /// Account segment of the request path; empty means `my`.
  std::string account;
  std::chrono::milliseconds timeout{30000};
  std::chrono::milliseconds connect_timeout{10000};
  std::string api_version{"~7.0"};
  std::string user_agent{"sdc/0.1.0"};
};

/// Map a libcurl transfer failure onto a datacenter error kind.
sdc::schema::dc_error_kind classify_transport_error(CURLcode code);

/// Return the error for a non-2xx response, std::nullopt otherwise.
///
/// CloudAPI error bodies (`{"code": ..., "message": ...}`) are folded into
/// the message when present.
std::optional<sdc::schema::client_error_t> classify_http_status(
    long status,
    std::string_view body);

/// Decode a ListMachines response body.
list_machines_result_t decode_machines(std::string_view body);

/// HTTP(S) client for the per-datacenter CloudAPI endpoints.
///
/// Each call performs exactly one GET on its own libcurl easy handle, so one
/// instance may be shared by concurrently running fan-out units.
class cloudapi_client final {
 public:
  cloudapi_client(sdc::schema::datacenter_directory_t directory,
                  cloudapi_options options);

  /// List every machine visible to the account in one datacenter.
  ///
  /// Datacenters missing from the directory are reported as unreachable.
  list_machines_result_t list_machines(
      const sdc::schema::datacenter_id_t& dc,
      const sdc::schema::list_machines_query_t& query) const;

  /// Bind this client as a fan-out call; the client must outlive it.
  datacenter_call_t as_call() const;

 private:
  sdc::schema::datacenter_directory_t directory_;
  cloudapi_options options_;
};

}  // namespace sdc::client
