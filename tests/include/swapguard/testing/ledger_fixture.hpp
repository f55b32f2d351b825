#pragma once

#include <swapguard/ledger/state_ledger.hpp>
#include <swapguard/schema/encoding/scale/encoder.hpp>
#include <swapguard/schema/primitives.hpp>
#include <swapguard/storage/rocksdb/storage.hpp>
#include <swapguard/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace swapguard::testing {

using scale_encoder_t = swapguard::schema::encoding::encoder<
    swapguard::schema::encoding::scale_encoder_tag>;
using rocksdb_storage_t =
    swapguard::storage::storage<swapguard::storage::rocksdb_storage_tag>;

/// Temporary RocksDB directory with a state_ledger on top of it.
class ledger_fixture {
 public:
  explicit ledger_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{swapguard::storage::make_storage<
            swapguard::storage::rocksdb_storage_tag>(db_path_)},
        ledger_{encoder_, storage_} {}

  ledger_fixture(const ledger_fixture&) = delete;
  ledger_fixture& operator=(const ledger_fixture&) = delete;
  ledger_fixture(ledger_fixture&&) = delete;
  ledger_fixture& operator=(ledger_fixture&&) = delete;

  ~ledger_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }
  scale_encoder_t& encoder() { return encoder_; }
  rocksdb_storage_t& storage() { return storage_; }
  swapguard::ledger::state_ledger& ledger() { return ledger_; }

  /// Every balance and allowance a guarded swap can touch, in a fixed order.
  std::vector<swapguard::schema::amount_t> snapshot() const {
    auto out = std::vector<swapguard::schema::amount_t>{};
    for (const auto& party : {caller_party(), executing_party(), venue_party()}) {
      out.push_back(ledger_.balance_of(party, input_asset()));
      out.push_back(ledger_.balance_of(party, output_asset()));
    }
    out.push_back(
        ledger_.allowance(caller_party(), executing_party(), input_asset()));
    out.push_back(
        ledger_.allowance(executing_party(), venue_party(), input_asset()));
    return out;
  }

  /// Give the caller `amount_in` of the input asset and let the executing
  /// party draw it.
  void fund_caller(const swapguard::schema::amount_t& amount_in) {
    EXPECT_EQ(ledger_.credit(caller_party(), input_asset(), amount_in),
              swapguard::ledger::ledger_status::ok);
    EXPECT_EQ(ledger_.authorize(caller_party(), executing_party(),
                                input_asset(), amount_in),
              swapguard::ledger::ledger_status::ok);
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  rocksdb_storage_t storage_;
  swapguard::ledger::state_ledger ledger_;
};

}  // namespace swapguard::testing
