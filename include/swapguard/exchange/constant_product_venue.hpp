#pragma once

#include <swapguard/exchange/venue.hpp>
#include <swapguard/ledger/ledger.hpp>
#include <swapguard/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <utility>

namespace swapguard::exchange {

/// Output of a constant-product swap of `amount_in` against the given
/// reserves after a fee of `fee_ppk` parts per thousand on the input.
swapguard::schema::amount_t get_amount_out(
    const swapguard::schema::amount_t& amount_in,
    const swapguard::schema::amount_t& reserve_in,
    const swapguard::schema::amount_t& reserve_out,
    uint32_t fee_ppk);

/// Constant-product pool venue.
///
/// Pool reserves are the venue party's own ledger balances, so every reserve
/// change made during settlement is staged and reverted together with the
/// rest of the invocation.
class constant_product_venue final : public venue {
 public:
  constant_product_venue(swapguard::ledger::ledger& ledger,
                         const swapguard::schema::party_id_t& party,
                         clock_source_t clock,
                         uint32_t fee_ppk = 3);

  /// List the unordered pair {asset_a, asset_b} for trading.
  void list_pair(const swapguard::schema::asset_id_t& asset_a,
                 const swapguard::schema::asset_id_t& asset_b);

  bool is_listed(const swapguard::schema::asset_id_t& asset_a,
                 const swapguard::schema::asset_id_t& asset_b) const;

  uint32_t fee_ppk() const { return fee_ppk_; }

  const swapguard::schema::party_id_t& party() const override {
    return party_;
  }

  std::optional<swapguard::schema::amount_t> quote(
      const swapguard::schema::amount_t& amount_in,
      const swapguard::schema::route_t& route) const override;

  venue_result_t execute_and_settle(
      const swapguard::schema::party_id_t& payer,
      const swapguard::schema::settlement_instruction_t& instruction)
      override;

 private:
  using pair_key_t =
      std::pair<swapguard::schema::asset_id_t, swapguard::schema::asset_id_t>;

  static pair_key_t make_pair_key(const swapguard::schema::asset_id_t& a,
                                  const swapguard::schema::asset_id_t& b);

  swapguard::ledger::ledger& ledger_;
  swapguard::schema::party_id_t party_;
  clock_source_t clock_;
  uint32_t fee_ppk_{3};
  std::set<pair_key_t> pairs_;
};

}  // namespace swapguard::exchange
