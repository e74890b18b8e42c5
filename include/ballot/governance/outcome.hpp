#pragma once

#include <ballot/schema/transaction_error_code.hpp>

namespace ballot::governance {

/// Result of a ledger operation: `code` is `ok` on success, otherwise the
/// reason the request was rejected. `value` is meaningful only on success.
template <typename T>
struct outcome final {
  ballot::schema::transaction_error_code code{
      ballot::schema::transaction_error_code::ok};
  T value{};

  bool ok() const { return code == ballot::schema::transaction_error_code::ok; }
};

template <>
struct outcome<void> final {
  ballot::schema::transaction_error_code code{
      ballot::schema::transaction_error_code::ok};

  bool ok() const { return code == ballot::schema::transaction_error_code::ok; }
};

}  // namespace ballot::governance
