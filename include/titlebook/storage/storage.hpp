#pragma once
#include <titlebook/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace titlebook::storage {

using key_value_entry_t =
    std::pair<titlebook::schema::bytes_t, titlebook::schema::bytes_t>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  titlebook::schema::hash32_t state_root;
};

template <typename Library>
struct storage {
  /// Return raw value at key, or std::nullopt when missing.
  std::optional<titlebook::schema::bytes_t> get(
      const titlebook::schema::bytes_view_t& key) const;

  /// Persist raw value at key outside of any checkpoint.
  void put(const titlebook::schema::bytes_view_t& key,
           const titlebook::schema::bytes_view_t& value) const;

  /// Atomically apply writes, in order, together with the new checkpoint.
  void commit(const std::vector<key_value_entry_t>& writes,
              const committed_state& state) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace titlebook::storage
