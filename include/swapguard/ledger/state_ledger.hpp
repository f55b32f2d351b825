#pragma once

#include <swapguard/ledger/ledger.hpp>
#include <swapguard/schema/encoding/scale/encoder.hpp>
#include <swapguard/schema/primitives.hpp>
#include <swapguard/storage/rocksdb/storage.hpp>

#include <map>
#include <vector>

namespace swapguard::ledger {

/// RocksDB-backed ledger with a staged write set.
///
/// Outside a transaction each mutation is written through immediately.
/// Between `begin` and `commit` mutations are staged in memory, reads observe
/// the staged values, and `commit` persists the whole set in one RocksDB write
/// batch. `rollback` discards the staged set, restoring the exact pre-begin
/// state.
class state_ledger final : public ledger {
 public:
  explicit state_ledger(
      swapguard::schema::encoding::encoder<
          swapguard::schema::encoding::scale_encoder_tag>& encoder,
      swapguard::storage::storage<swapguard::storage::rocksdb_storage_tag>&
          storage);

  swapguard::schema::amount_t balance_of(
      const swapguard::schema::party_id_t& holder,
      const swapguard::schema::asset_id_t& asset) const override;

  swapguard::schema::amount_t allowance(
      const swapguard::schema::party_id_t& owner,
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::asset_id_t& asset) const override;

  ledger_status transfer(const swapguard::schema::party_id_t& from,
                         const swapguard::schema::party_id_t& to,
                         const swapguard::schema::asset_id_t& asset,
                         const swapguard::schema::amount_t& amount) override;

  ledger_status transfer_from(
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::party_id_t& from,
      const swapguard::schema::party_id_t& to,
      const swapguard::schema::asset_id_t& asset,
      const swapguard::schema::amount_t& amount) override;

  ledger_status authorize(const swapguard::schema::party_id_t& owner,
                          const swapguard::schema::party_id_t& spender,
                          const swapguard::schema::asset_id_t& asset,
                          const swapguard::schema::amount_t& amount) override;

  ledger_status raise_authorization(
      const swapguard::schema::party_id_t& owner,
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::asset_id_t& asset,
      const swapguard::schema::amount_t& minimum) override;

  /// Credit newly issued funds to `holder` (deposits and pool seeding).
  ledger_status credit(const swapguard::schema::party_id_t& holder,
                       const swapguard::schema::asset_id_t& asset,
                       const swapguard::schema::amount_t& amount);

  /// Open a staged transaction. Nesting is a programming error.
  void begin();

  /// Persist staged writes plus `extra_writes` in one atomic batch.
  void commit(const std::vector<swapguard::storage::staged_write_t>&
                  extra_writes = {});

  /// Discard staged writes.
  void rollback();

  bool in_transaction() const;

 private:
  swapguard::schema::amount_t read_amount(
      const swapguard::schema::bytes_t& key) const;
  void write_amount(const swapguard::schema::bytes_t& key,
                    const swapguard::schema::amount_t& amount);
  ledger_status move_balance(const swapguard::schema::party_id_t& from,
                     const swapguard::schema::party_id_t& to,
                     const swapguard::schema::asset_id_t& asset,
                     const swapguard::schema::amount_t& amount);

  swapguard::schema::encoding::encoder<
      swapguard::schema::encoding::scale_encoder_tag>& encoder_;
  swapguard::storage::storage<swapguard::storage::rocksdb_storage_tag>&
      storage_;
  bool transaction_open_{false};
  std::map<swapguard::schema::bytes_t, swapguard::schema::bytes_t> staged_;
};

/// Scoped envelope over a state_ledger transaction.
///
/// Rolls back on destruction unless `commit` or `rollback` ran first.
class ledger_transaction final {
 public:
  explicit ledger_transaction(state_ledger& ledger);
  ~ledger_transaction();

  ledger_transaction(const ledger_transaction&) = delete;
  ledger_transaction& operator=(const ledger_transaction&) = delete;
  ledger_transaction(ledger_transaction&&) = delete;
  ledger_transaction& operator=(ledger_transaction&&) = delete;

  void commit(const std::vector<swapguard::storage::staged_write_t>&
                  extra_writes = {});
  void rollback();

 private:
  state_ledger& ledger_;
  bool resolved_{false};
};

}  // namespace swapguard::ledger
