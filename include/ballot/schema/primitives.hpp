#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ballot::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using proposal_id_t = uint64_t;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Parse a 32-byte hash from 64 hex digits (optional 0x prefix).
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

/// Parse an address from a protobuf bytes field: exactly 20 raw bytes, or 40
/// hex digits with an optional 0x prefix. A 20-byte input is always raw.
std::optional<address_t> try_make_address(const std::string_view& bytes);
/// Parse an address from text: 40 hex digits, optional 0x prefix.
std::optional<address_t> try_make_address_from_hex(const std::string_view& hex);
/// The all-zero address; never a valid administrator.
address_t make_null_address();
bool is_null_address(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);

}  // namespace ballot::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
