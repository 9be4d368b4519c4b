#include <spdlog/fmt/fmt.h>
#include <titlebook/common/critical.hpp>
#include <titlebook/storage/rocksdb/storage.hpp>

namespace {

// Small store written one invocation at a time. Detected corruption stops the
// database instead of being skipped.
ROCKSDB_NAMESPACE::Options make_ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();
  return options;
}

}  // namespace

namespace titlebook::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* handle{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_ledger_options(),
                                            std::string{path}, &handle);
  if (!status.ok()) {
    titlebook::common::critical(fmt::format(
        "cannot open ledger store at {}: {}", path, status.ToString()));
  }

  auto ledger = storage<rocksdb_storage_tag>{};
  ledger.database.reset(handle);
  spdlog::info("Opened ledger store at {}", path);
  return ledger;
}

}  // namespace titlebook::storage
