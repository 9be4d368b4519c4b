#pragma once

#include <titlebook/schema/encoding/scale/encoder.hpp>
#include <titlebook/schema/primitives.hpp>
#include <titlebook/storage/rocksdb/storage.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace titlebook::execution {

using encoder_t = titlebook::schema::encoding::encoder<
    titlebook::schema::encoding::scale_encoder_tag>;
using storage_t =
    titlebook::storage::storage<titlebook::storage::rocksdb_storage_tag>;

/// State access for a single invocation.
///
/// Reads always hit the committed store. Writes are recorded, in issue order,
/// into the invocation's write set and only reach the store when the engine
/// commits the invocation. Discarding the context discards its writes.
class context final {
 public:
  context(encoder_t& encoder, const storage_t& storage);

  context(const context&) = delete;
  context& operator=(const context&) = delete;

  /// Committed value at key, or std::nullopt when missing.
  std::optional<titlebook::schema::bytes_t> get_state(
      std::string_view key) const;

  /// Append a write to the write set.
  void put_state(std::string_view key, titlebook::schema::bytes_t value);

  const std::vector<titlebook::storage::key_value_entry_t>& writes() const;

  encoder_t& encoder() const;

 private:
  encoder_t& encoder_;
  const storage_t& storage_;
  std::vector<titlebook::storage::key_value_entry_t> writes_;
};

}  // namespace titlebook::execution
