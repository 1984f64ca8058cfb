#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace sdc::schema::encoding {

// Encoders are selected at build time through a library tag, e.g.
// encoder<json_encoder_tag>. Payloads are text documents.
template <typename Library>
struct encoder {
  template <typename T>
  std::string encode(const T& obj);

  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text, std::string& error);
};

}  // namespace sdc::schema::encoding
