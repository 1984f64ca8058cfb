#pragma once

#include <map>
#include <string>
#include <vector>

namespace sdc::schema {

using datacenter_id_t = std::string;
using endpoint_url_t = std::string;
using datacenter_directory_t = std::map<datacenter_id_t, endpoint_url_t>;
using datacenter_list_t = std::vector<datacenter_id_t>;

}  // namespace sdc::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
