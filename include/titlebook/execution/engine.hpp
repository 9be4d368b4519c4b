#pragma once

#include <titlebook/execution/context.hpp>
#include <titlebook/schema/invocation.hpp>
#include <titlebook/schema/ledger_info.hpp>
#include <titlebook/schema/operation.hpp>
#include <titlebook/schema/operation_result.hpp>
#include <titlebook/schema/primitives.hpp>
#include <mutex>

namespace titlebook::execution {

/// Ownership ledger state machine hosting the record operations.
///
/// Each invocation runs to completion under the engine lock. A successful
/// mutating invocation commits its whole write set, together with the next
/// checkpoint, in one atomic storage write. A failed invocation commits
/// nothing.
class engine final {
 public:
  /// Bind the engine to encoder/storage backends and load the checkpoint.
  explicit engine(encoder_t& encoder, storage_t& storage);

  /// Validate function name and arguments without touching state.
  titlebook::schema::operation_result_t check(
      const titlebook::schema::invocation_t& invocation) const;

  /// Execute an invocation and commit its writes when it succeeds.
  ///
  /// For `query` the stored bytes are returned in `data`.
  titlebook::schema::operation_result_t invoke(
      const titlebook::schema::invocation_t& invocation);

  /// Latest committed checkpoint.
  titlebook::schema::ledger_info_t info() const;

 private:
  titlebook::schema::operation_result_t execute_operation(
      const titlebook::schema::operation_t& operation,
      context& ctx);

  /// Seed three participants each holding one asset.
  titlebook::schema::operation_result_t init_ledger(context& ctx);

  /// Commit the context's write set and advance the checkpoint.
  void commit(const context& ctx);

  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  int64_t last_committed_height_{};
  titlebook::schema::hash32_t last_committed_state_root_;
};

}  // namespace titlebook::execution
