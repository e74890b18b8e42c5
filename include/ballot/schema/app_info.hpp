#pragma once

#include <ballot/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace ballot::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t schema_version{1};
  std::string data{"ballot-governance"};
  std::string version{"0.1.0"};
  uint64_t app_version{1};
  uint64_t height{};
  hash32_t state_root{};
  hash32_t chain_id{};
};

using app_info_t = app_info<1>;

}  // namespace ballot::schema
