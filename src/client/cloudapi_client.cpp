#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sdc/client/cloudapi_client.hpp>
#include <sdc/client/endpoint.hpp>
#include <sdc/schema/encoding/json/encoder.hpp>

#include <array>
#include <memory>
#include <mutex>
#include <utility>

using namespace sdc::schema;

namespace {

using encoder_t =
    sdc::schema::encoding::encoder<sdc::schema::encoding::json_encoder_tag>;
using curl_handle_t = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_headers_t =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag& curl_init_flag() {
  static std::once_flag flag;
  return flag;
}

size_t append_body(char* data, size_t size, size_t count, void* user_data) {
  auto* body = static_cast<std::string*>(user_data);
  body->append(data, size * count);
  return size * count;
}

bool append_header(curl_headers_t& headers, const std::string& header) {
  auto* list = curl_slist_append(headers.get(), header.c_str());
  if (list == nullptr) {
    return false;
  }
  static_cast<void>(headers.release());
  headers.reset(list);
  return true;
}

}  // namespace

namespace sdc::client {

dc_error_kind classify_transport_error(const CURLcode code) {
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      return dc_error_kind::timeout;
    case CURLE_LOGIN_DENIED:
    case CURLE_REMOTE_ACCESS_DENIED:
      return dc_error_kind::auth_failure;
    case CURLE_WEIRD_SERVER_REPLY:
    case CURLE_BAD_CONTENT_ENCODING:
      return dc_error_kind::malformed_response;
    case CURLE_OUT_OF_MEMORY:
    case CURLE_WRITE_ERROR:
    case CURLE_FAILED_INIT:
      return dc_error_kind::internal_fault;
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    default:
      return dc_error_kind::unreachable;
  }
}

std::optional<client_error_t> classify_http_status(const long status,
                                                   const std::string_view body) {
  if (status >= 200 && status < 300) {
    return std::nullopt;
  }
  auto message = "HTTP " + std::to_string(status);
  auto document = nlohmann::json::parse(body, nullptr, false);
  if (!document.is_discarded() && document.is_object()) {
    auto member = [&](const char* key) {
      auto it = document.find(key);
      return it != std::end(document) && it->is_string()
                 ? it->get<std::string>()
                 : std::string{};
    };
    auto code = member("code");
    auto detail = member("message");
    if (!code.empty()) {
      message += ": " + code;
    }
    if (!detail.empty()) {
      message += (code.empty() ? ": " : " - ") + detail;
    }
  }
  if (status == 401 || status == 403) {
    return client_error_t{.kind = dc_error_kind::auth_failure,
                          .message = std::move(message)};
  }
  return client_error_t{.kind = dc_error_kind::server_error,
                        .message = std::move(message)};
}

list_machines_result_t decode_machines(const std::string_view body) {
  auto error = std::string{};
  auto machines = encoder_t{}.try_decode<std::vector<machine_t>>(body, error);
  if (!machines) {
    return client_error_t{.kind = dc_error_kind::malformed_response,
                          .message = "invalid machines response: " + error};
  }
  return std::move(*machines);
}

cloudapi_client::cloudapi_client(datacenter_directory_t directory,
                                 cloudapi_options options)
    : directory_(std::move(directory)), options_(std::move(options)) {
  std::call_once(curl_init_flag(),
                 [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

list_machines_result_t cloudapi_client::list_machines(
    const datacenter_id_t& dc,
    const list_machines_query_t& query) const {
  auto endpoint = directory_.find(dc);
  if (endpoint == std::end(directory_)) {
    return client_error_t{.kind = dc_error_kind::unreachable,
                          .message = "unknown datacenter '" + dc + "'"};
  }

  auto handle = curl_handle_t{curl_easy_init(), &curl_easy_cleanup};
  if (!handle) {
    return client_error_t{.kind = dc_error_kind::internal_fault,
                          .message = "failed to initialize HTTP handle"};
  }
  auto headers = curl_headers_t{nullptr, &curl_slist_free_all};
  if (!append_header(headers, "Accept: application/json") ||
      !append_header(headers, "Api-Version: " + options_.api_version)) {
    return client_error_t{.kind = dc_error_kind::internal_fault,
                          .message = "failed to build request headers"};
  }

  auto url =
      make_list_machines_url(endpoint->second, options_.account, query);
  auto body = std::string{};
  auto error_buffer = std::array<char, CURL_ERROR_SIZE>{};
  auto* curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                   static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(options_.connect_timeout.count()));
  // Worker threads must not receive SIGALRM from the resolver.
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());

  spdlog::debug("GET {} (dc {})", url, dc);
  auto code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    auto message = std::string{error_buffer.data()};
    if (message.empty()) {
      message = curl_easy_strerror(code);
    }
    return client_error_t{.kind = classify_transport_error(code),
                          .message = std::move(message)};
  }

  auto status = 0L;
  if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
    return client_error_t{.kind = dc_error_kind::internal_fault,
                          .message = "failed to read HTTP status"};
  }
  spdlog::debug("dc {} answered HTTP {} with {} byte(s)", dc, status,
                body.size());
  if (auto error = classify_http_status(status, body)) {
    return std::move(*error);
  }
  return decode_machines(body);
}

datacenter_call_t cloudapi_client::as_call() const {
  return [this](const datacenter_id_t& dc,
                const list_machines_query_t& query) {
    return list_machines(dc, query);
  };
}

}  // namespace sdc::client
