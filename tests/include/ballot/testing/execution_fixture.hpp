#pragma once

#include <ballot/blake3/hash.hpp>
#include <ballot/execution/engine.hpp>
#include <ballot/schema/primitives.hpp>
#include <ballot/storage/rocksdb/storage.hpp>
#include <ballot/testing/common.hpp>
#include <ballot/testing/execution_harness.hpp>

#include <string>
#include <string_view>

namespace ballot::testing {

inline ballot::schema::hash32_t test_chain_id() {
  return ballot::blake3::hash(std::string_view{"ballot-test"});
}

/// Engine over a throwaway RocksDB directory with a settable clock.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{ballot::storage::make_storage<
            ballot::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_, test_chain_id(), administrator_address(),
                [this] { return now_; }} {}

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  ballot::storage::storage<ballot::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  ballot::execution::engine& engine() { return engine_; }
  const ballot::execution::engine& engine() const { return engine_; }

  void set_now(const ballot::schema::timestamp_seconds_t now) { now_ = now; }

  ballot::schema::transaction_result_t submit(
      const ballot::schema::address_t& signer,
      const ballot::schema::transaction_payload_t& payload) {
    return ballot::testing::submit(
        engine_, make_transaction(test_chain_id(), signer, payload));
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  ballot::storage::storage<ballot::storage::rocksdb_storage_tag> storage_;
  ballot::schema::timestamp_seconds_t now_{1'700'000'000};
  ballot::execution::engine engine_;
};

}  // namespace ballot::testing
