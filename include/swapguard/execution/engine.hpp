#pragma once

#include <swapguard/exchange/venue.hpp>
#include <swapguard/execution/custody_intake.hpp>
#include <swapguard/execution/engine_config.hpp>
#include <swapguard/execution/guarded_executor.hpp>
#include <swapguard/ledger/state_ledger.hpp>
#include <swapguard/schema/encoding/scale/encoder.hpp>
#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/swap_receipt.hpp>
#include <swapguard/schema/swap_request.hpp>
#include <swapguard/schema/swap_result.hpp>
#include <swapguard/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace swapguard::execution {

/// Guarded swap entry point.
///
/// Each invocation runs custody intake and guarded execution inside one
/// ledger transaction: either every balance and allowance change of the
/// invocation is committed together, or none is. A receipt is appended to the
/// audit trail in both cases and folded into the committed state root.
class engine final {
 public:
  explicit engine(
      swapguard::schema::encoding::encoder<
          swapguard::schema::encoding::scale_encoder_tag>& encoder,
      swapguard::storage::storage<swapguard::storage::rocksdb_storage_tag>&
          storage,
      swapguard::ledger::state_ledger& ledger,
      swapguard::exchange::venue& venue,
      engine_config config,
      swapguard::exchange::clock_source_t clock =
          swapguard::exchange::system_clock_source());

  /// Swap `amount_in` of the configured input asset held by `caller` for the
  /// configured output asset, settling only if at least
  /// `minimum_amount_out` is paid to `caller`.
  ///
  /// `caller` must have authorized the executing party for `amount_in`.
  swapguard::schema::swap_result_t swap(
      const swapguard::schema::party_id_t& caller,
      const swapguard::schema::amount_t& amount_in,
      const swapguard::schema::amount_t& minimum_amount_out);

  /// Current venue price for `amount_in` along the configured route.
  std::optional<swapguard::schema::amount_t> quote(
      const swapguard::schema::amount_t& amount_in) const;

  /// Latest committed audit checkpoint.
  swapguard::storage::committed_state info() const;

  /// Receipts with sequence in the inclusive range.
  std::vector<swapguard::schema::swap_receipt_t> history(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  const engine_config& config() const { return config_; }

 private:
  /// Resolve `request` inside the ledger envelope and record its receipt.
  swapguard::schema::swap_result_t execute(
      const swapguard::schema::swap_request_t& request);

  swapguard::schema::hash32_t make_request_id(
      const swapguard::schema::swap_request_t& request,
      uint64_t sequence) const;

  mutable std::mutex mutex_;
  swapguard::schema::encoding::encoder<
      swapguard::schema::encoding::scale_encoder_tag>& encoder_;
  swapguard::storage::storage<swapguard::storage::rocksdb_storage_tag>&
      storage_;
  swapguard::ledger::state_ledger& ledger_;
  swapguard::exchange::venue& venue_;
  engine_config config_;
  swapguard::exchange::clock_source_t clock_;
  custody_intake intake_;
  guarded_executor executor_;
  uint64_t last_sequence_{};
  swapguard::schema::hash32_t state_root_{};
};

}  // namespace swapguard::execution
