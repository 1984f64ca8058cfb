#include <sdc/client/endpoint.hpp>

#include <cctype>

namespace sdc::client {

std::string url_encode(const std::string_view value) {
  static constexpr auto kHex = "0123456789ABCDEF";
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0 || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(c);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[(uc >> 4u) & 0x0Fu]);
    out.push_back(kHex[uc & 0x0Fu]);
  }
  return out;
}

std::string make_list_machines_url(
    std::string_view endpoint,
    const std::string_view account,
    const sdc::schema::list_machines_query_t& query) {
  while (endpoint.ends_with('/')) {
    endpoint.remove_suffix(1);
  }
  auto url = std::string{endpoint};
  url += '/';
  url += account.empty() ? std::string{"my"} : url_encode(account);
  url += "/machines";

  auto separator = '?';
  for (const auto& [key, value] : query.filters) {
    url += separator;
    url += url_encode(key);
    url += '=';
    url += url_encode(value);
    separator = '&';
  }
  return url;
}

}  // namespace sdc::client
