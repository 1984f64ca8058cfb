#pragma once

#include <sdc/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: machine.
// One compute instance as reported by a single datacenter. Machine ids are
// only unique within the datacenter that returned them.
namespace sdc::schema {

template <uint16_t Version>
struct machine;

template <>
struct machine<1> final {
  uint16_t version{1};
  std::string id;
  std::string name;
  std::string type;
  std::string brand;
  std::string state;
  std::string image;
  std::string package;
  uint64_t memory{};
  uint64_t disk{};
  std::string created;
  std::string updated;
  std::string compute_node;
  std::string primary_ip;
  std::vector<std::string> ips;

  bool operator==(const machine&) const = default;
};

using machine_t = machine<1>;

/// A machine tagged with the datacenter it was listed from.
struct machine_record_t final {
  datacenter_id_t dc;
  machine_t machine;

  bool operator==(const machine_record_t&) const = default;
};

}  // namespace sdc::schema
