#pragma once

#include <ballot/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace ballot::testing {

inline ballot::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = ballot::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Distinct, non-null address per seed.
inline ballot::schema::address_t address_from_seed(const uint8_t seed) {
  auto out = ballot::schema::address_t{};
  out[0] = 0xA0;
  out[out.size() - 1] = seed;
  return out;
}

inline ballot::schema::address_t administrator_address() {
  return address_from_seed(0xAD);
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace ballot::testing
