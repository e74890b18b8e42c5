#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: transaction error code.
// Governance workflow: Stable numeric failure taxonomy shared by the ledger,
// the execution engine, and RPC responses. Zero is success.
namespace ballot::schema {

enum class transaction_error_code : uint32_t {
  ok = 0,
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_input = 10,
  not_found = 11,
  inactive = 12,
  already_closed = 13,
  duplicate_vote = 14,
  unauthorized = 15,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "ok", transaction_error_code::ok},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_chain_id", transaction_error_code::invalid_chain_id},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_input", transaction_error_code::invalid_input},
    std::pair<std::string_view, transaction_error_code>{
        "not_found", transaction_error_code::not_found},
    std::pair<std::string_view, transaction_error_code>{
        "inactive", transaction_error_code::inactive},
    std::pair<std::string_view, transaction_error_code>{
        "already_closed", transaction_error_code::already_closed},
    std::pair<std::string_view, transaction_error_code>{
        "duplicate_vote", transaction_error_code::duplicate_vote},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized}};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  auto found = std::ranges::find_if(
      kTransactionErrorCodeMappings,
      [&](const auto& mapping) { return mapping.second == value; });
  if (found == std::end(kTransactionErrorCodeMappings)) {
    return "unknown";
  }
  return found->first;
}

}  // namespace ballot::schema
