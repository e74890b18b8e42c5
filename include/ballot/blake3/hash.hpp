#pragma once
#include <ballot/schema/primitives.hpp>
#include <string_view>

namespace ballot::blake3 {

ballot::schema::hash32_t hash(const std::string_view& str);
ballot::schema::hash32_t hash(const ballot::schema::bytes_view_t& bytes);

}  // namespace ballot::blake3
