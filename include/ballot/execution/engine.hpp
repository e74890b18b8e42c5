#pragma once

#include <ballot/governance/ledger.hpp>
#include <ballot/schema/app_info.hpp>
#include <ballot/schema/encoding/encoder.hpp>
#include <ballot/schema/encoding/scale/encoder.hpp>
#include <ballot/schema/ledger_event.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/schema/query_result.hpp>
#include <ballot/schema/transaction.hpp>
#include <ballot/schema/transaction_error_code.hpp>
#include <ballot/schema/transaction_event.hpp>
#include <ballot/schema/transaction_result.hpp>
#include <ballot/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace ballot::execution {

/// Source of "now" for proposal and event timestamps, in seconds.
using time_source_t = std::function<ballot::schema::timestamp_seconds_t()>;

/// Seconds since the Unix epoch from the system clock.
ballot::schema::timestamp_seconds_t system_time_seconds();

/// Flatten a ledger notification into a typed key/value event.
ballot::schema::transaction_event_t make_transaction_event(
    const ballot::schema::ledger_event_t& event);

/// Transaction front end for the governance ledger.
///
/// The engine decodes and validates transaction envelopes, executes payloads
/// against the ledger, and writes every resulting row together with the new
/// height and state root in one storage batch. On construction it restores the
/// ledger from storage.
class engine final {
 public:
  /// `genesis_administrator` is only used when storage holds no
  /// administrator row yet.
  engine(ballot::schema::encoding::encoder<
             ballot::schema::encoding::scale_encoder_tag>& encoder,
         ballot::storage::storage<ballot::storage::rocksdb_storage_tag>& storage,
         ballot::schema::hash32_t chain_id,
         ballot::schema::address_t genesis_administrator,
         time_source_t time_source = system_time_seconds);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Admission check: decode, version and chain id only. No state change.
  ballot::schema::transaction_result_t check_transaction(
      const ballot::schema::bytes_view_t& raw_tx);

  /// Decode, validate and execute an encoded transaction.
  ballot::schema::transaction_result_t submit_transaction(
      const ballot::schema::bytes_view_t& raw_tx);

  /// Validate and execute an already decoded transaction.
  ballot::schema::transaction_result_t execute_transaction(
      const ballot::schema::transaction_t& tx);

  /// Application metadata: applied transaction count and state root.
  ballot::schema::app_info_t info() const;

  /// Read-path query by route. Inputs and outputs are SCALE encoded.
  ballot::schema::query_result_t query(
      std::string_view path,
      const ballot::schema::bytes_view_t& data) const;

  /// Persisted events with sequence in [from_sequence, to_sequence], at most
  /// 1000 per call. Sequences start at 1.
  std::vector<ballot::schema::event_record_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  /// Typed read access for transport layers.
  const ballot::governance::ledger& ledger() const;

 private:
  ballot::schema::transaction_result_t validate_transaction(
      const ballot::schema::transaction_t& tx,
      std::string_view codespace) const;

  ballot::schema::transaction_result_t execute_operation(
      const ballot::schema::transaction_t& tx);

  /// Write the rows touched by `pending_events_` and fold the state root.
  void persist(const ballot::schema::transaction_t& tx);

  std::vector<ballot::schema::event_record_t> read_events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  void load_persisted_state(
      const ballot::schema::address_t& genesis_administrator);

  mutable std::mutex mutex_;
  ballot::schema::encoding::encoder<
      ballot::schema::encoding::scale_encoder_tag>& encoder_;
  ballot::storage::storage<ballot::storage::rocksdb_storage_tag>& storage_;
  ballot::schema::hash32_t chain_id_;
  time_source_t time_source_;
  std::unique_ptr<ballot::governance::ledger> ledger_;
  std::vector<ballot::schema::ledger_event_t> pending_events_;
  uint64_t height_{};
  ballot::schema::hash32_t state_root_{};
  uint64_t event_sequence_{};
};

}  // namespace ballot::execution
