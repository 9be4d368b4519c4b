#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <titlebook/common/critical.hpp>
#include <titlebook/schema/encoding/scale/encoder.hpp>
#include <titlebook/storage/storage.hpp>
#include <memory>
#include <string_view>
#include <tuple>

namespace titlebook::storage {

namespace detail {

using encoder_t = titlebook::schema::encoding::encoder<
    titlebook::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const titlebook::schema::bytes_view_t& bytes) {
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

  std::optional<titlebook::schema::bytes_t> get(
      const titlebook::schema::bytes_view_t& key) const;
  void put(const titlebook::schema::bytes_view_t& key,
           const titlebook::schema::bytes_view_t& value) const;
  void commit(const std::vector<key_value_entry_t>& writes,
              const committed_state& state) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<titlebook::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const titlebook::schema::bytes_view_t& key) const {
  if (!database) {
    titlebook::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      titlebook::common::critical("Failed to get value from RocksDB");
    }
  }
  return titlebook::schema::bytes_t{std::begin(value), std::end(value)};
}

inline void storage<rocksdb_storage_tag>::put(
    const titlebook::schema::bytes_view_t& key,
    const titlebook::schema::bytes_view_t& value) const {
  if (!database) {
    titlebook::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    titlebook::common::critical("Failed to put value into RocksDB");
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& writes,
    const committed_state& state) const {
  if (!database) {
    titlebook::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto put_status = batch.Put(
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(key.data()),
                                 key.size()},
        ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(value.data()),
                                 value.size()});
    if (!put_status.ok()) {
      titlebook::common::critical("failed staging write into batch");
    }
  }
  auto state_status =
      batch.Put(std::string{detail::kCommittedHeightKey},
                detail::encode_committed_state(state));
  if (!state_status.ok()) {
    titlebook::common::critical("failed staging committed state into batch");
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    titlebook::common::critical("failed to commit write batch");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    titlebook::common::critical("RocksDB database is not initialized");
  }
  auto state = committed_state{};

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedHeightKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    titlebook::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, titlebook::schema::hash32_t>>(
          titlebook::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    titlebook::common::critical("failed to decode committed state");
  }
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());

  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    titlebook::common::critical("RocksDB database is not initialized");
  }
  auto state_status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                    std::string{detail::kCommittedHeightKey},
                    detail::encode_committed_state(state));
  if (!state_status.ok()) {
    titlebook::common::critical("failed to persist committed height");
  }
}

}  // namespace titlebook::storage
