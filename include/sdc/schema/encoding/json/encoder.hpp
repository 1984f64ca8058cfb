#pragma once
#include <nlohmann/json.hpp>
#include <sdc/schema/encoding/encoder.hpp>
#include <sdc/schema/encoding/json/machine.hpp>

namespace sdc::schema::encoding {

struct json_encoder_tag {};

template <>
struct encoder<json_encoder_tag> final {
  /// Pretty-printed with four-space indentation.
  template <typename T>
  std::string encode(const T& obj);

  /// Throws nlohmann::json::exception on syntax or shape errors.
  template <typename T>
  T decode(std::string_view text);

  template <typename T>
  std::optional<T> try_decode(std::string_view text, std::string& error);
};

template <typename T>
std::string encoder<json_encoder_tag>::encode(const T& obj) {
  auto document = nlohmann::json(obj);
  return document.dump(4);
}

template <typename T>
T encoder<json_encoder_tag>::decode(const std::string_view text) {
  auto document = nlohmann::json::parse(text);
  return document.get<T>();
}

template <typename T>
std::optional<T> encoder<json_encoder_tag>::try_decode(
    const std::string_view text,
    std::string& error) {
  try {
    return decode<T>(text);
  } catch (const nlohmann::json::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace sdc::schema::encoding
