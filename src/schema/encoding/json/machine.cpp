#include <sdc/schema/encoding/json/machine.hpp>

using namespace sdc::schema;

namespace {

// Absent and null members keep their defaults; present members must have the
// expected JSON type.
template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == std::end(j) || it->is_null()) {
    return;
  }
  it->get_to(out);
}

}  // namespace

namespace sdc::schema::encoding::json {

void encode(const machine<1>& o, nlohmann::json& j) {
  j = nlohmann::json::object();
  j["id"] = o.id;
  j["name"] = o.name;
  j["type"] = o.type;
  j["brand"] = o.brand;
  j["state"] = o.state;
  j["image"] = o.image;
  j["package"] = o.package;
  j["memory"] = o.memory;
  j["disk"] = o.disk;
  j["created"] = o.created;
  j["updated"] = o.updated;
  j["compute_node"] = o.compute_node;
  j["primaryIp"] = o.primary_ip;
  j["ips"] = o.ips;
}

void decode(machine<1>& o, const nlohmann::json& j) {
  // at() rejects non-object documents with a type_error.
  j.at("id").get_to(o.id);
  read_optional(j, "name", o.name);
  read_optional(j, "type", o.type);
  read_optional(j, "brand", o.brand);
  read_optional(j, "state", o.state);
  read_optional(j, "image", o.image);
  read_optional(j, "package", o.package);
  read_optional(j, "memory", o.memory);
  read_optional(j, "disk", o.disk);
  read_optional(j, "created", o.created);
  read_optional(j, "updated", o.updated);
  read_optional(j, "compute_node", o.compute_node);
  read_optional(j, "primaryIp", o.primary_ip);
  read_optional(j, "ips", o.ips);
}

void encode(const machine_record_t& o, nlohmann::json& j) {
  encode(o.machine, j);
  j["dc"] = o.dc;
}

void decode(machine_record_t& o, const nlohmann::json& j) {
  decode(o.machine, j);
  j.at("dc").get_to(o.dc);
}

}  // namespace sdc::schema::encoding::json
