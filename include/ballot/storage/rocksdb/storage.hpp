#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <ballot/common/critical.hpp>
#include <ballot/schema/encoding/scale/encoder.hpp>
#include <ballot/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace ballot::storage {

namespace detail {

using encoder_t = ballot::schema::encoding::encoder<
    ballot::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ballot::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const ballot::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline std::string encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ballot::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ballot::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ballot::schema::bytes_view_t& prefix) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const ballot::schema::bytes_view_t& key) const {
  if (!database) {
    ballot::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    ballot::common::critical("Failed to get value from RocksDB");
  }
  auto decoded = encoder.template try_decode<T>(ballot::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!decoded.has_value()) {
    ballot::common::critical("Failed to decode value read from RocksDB");
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const ballot::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    ballot::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(ballot::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    ballot::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    ballot::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    ballot::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint64_t, ballot::schema::hash32_t>>(
          ballot::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    ballot::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const ballot::schema::bytes_view_t& prefix) const {
  if (!database) {
    ballot::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    ballot::common::critical("failed to list keys by prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    ballot::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(ballot::schema::bytes_view_t{key}),
                  detail::to_slice(ballot::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      ballot::common::critical("failed writing key into batch");
    }
  }
  auto state_status = batch.Put(std::string{detail::kCommittedHeightKey},
                                detail::encode_committed_state(state));
  if (!state_status.ok()) {
    ballot::common::critical("failed writing committed state into batch");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch of {} row(s): {}", entries.size(),
                  write_status.ToString());
    ballot::common::critical("failed to commit write batch");
  }
}

}  // namespace ballot::storage
