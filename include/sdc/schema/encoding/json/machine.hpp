#pragma once

#include <nlohmann/json.hpp>
#include <sdc/schema/machine.hpp>

namespace sdc::schema::encoding::json {

/// CloudAPI field names: `compute_node`, `primaryIp`, `ips`, etc.
void encode(const machine<1>& o, nlohmann::json& j);
void decode(machine<1>& o, const nlohmann::json& j);

/// Same as the machine encoding with an extra `dc` member.
void encode(const machine_record_t& o, nlohmann::json& j);
void decode(machine_record_t& o, const nlohmann::json& j);

}  // namespace sdc::schema::encoding::json

namespace nlohmann {

template <>
struct adl_serializer<sdc::schema::machine_t> {
  static void to_json(nlohmann::json& j, const sdc::schema::machine_t& o) {
    sdc::schema::encoding::json::encode(o, j);
  }
  static void from_json(const nlohmann::json& j, sdc::schema::machine_t& o) {
    sdc::schema::encoding::json::decode(o, j);
  }
};

template <>
struct adl_serializer<sdc::schema::machine_record_t> {
  static void to_json(nlohmann::json& j,
                      const sdc::schema::machine_record_t& o) {
    sdc::schema::encoding::json::encode(o, j);
  }
  static void from_json(const nlohmann::json& j,
                        sdc::schema::machine_record_t& o) {
    sdc::schema::encoding::json::decode(o, j);
  }
};

}  // namespace nlohmann
