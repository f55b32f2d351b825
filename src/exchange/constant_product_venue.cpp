#include <spdlog/spdlog.h>
#include <swapguard/common/critical.hpp>
#include <swapguard/exchange/constant_product_venue.hpp>

#include <algorithm>

using namespace swapguard::schema;

namespace swapguard::exchange {

namespace {

inline constexpr uint32_t kFeeDenominator = 1000;

}  // namespace

amount_t get_amount_out(const amount_t& amount_in,
                        const amount_t& reserve_in,
                        const amount_t& reserve_out,
                        const uint32_t fee_ppk) {
  using wide_t = boost::multiprecision::uint1024_t;
  if (amount_in == 0 || reserve_in == 0 || reserve_out == 0) {
    return amount_t{0};
  }
  auto amount_in_with_fee =
      wide_t{static_cast<wide_t>(amount_in) * (kFeeDenominator - fee_ppk)};
  auto numerator =
      wide_t{amount_in_with_fee * static_cast<wide_t>(reserve_out)};
  auto denominator = wide_t{static_cast<wide_t>(reserve_in) * kFeeDenominator +
                            amount_in_with_fee};
  // numerator / denominator < reserve_out, so the narrowing is exact.
  auto quotient = wide_t{numerator / denominator};
  return static_cast<amount_t>(quotient);
}

constant_product_venue::constant_product_venue(ledger::ledger& ledger,
                                               const party_id_t& party,
                                               clock_source_t clock,
                                               const uint32_t fee_ppk)
    : ledger_{ledger},
      party_{party},
      clock_{std::move(clock)},
      fee_ppk_{fee_ppk} {
  if (fee_ppk_ >= kFeeDenominator) {
    swapguard::common::critical("venue fee must be below 1000 ppk");
  }
  if (!clock_) {
    swapguard::common::critical("venue requires a clock source");
  }
}

void constant_product_venue::list_pair(const asset_id_t& asset_a,
                                       const asset_id_t& asset_b) {
  if (asset_a == asset_b) {
    spdlog::warn("Ignoring pair listing with identical assets {}",
                 to_hex(asset_a));
    return;
  }
  pairs_.insert(make_pair_key(asset_a, asset_b));
  spdlog::info("Listed pair {} / {}", to_hex(asset_a), to_hex(asset_b));
}

bool constant_product_venue::is_listed(const asset_id_t& asset_a,
                                       const asset_id_t& asset_b) const {
  return pairs_.contains(make_pair_key(asset_a, asset_b));
}

std::optional<amount_t> constant_product_venue::quote(
    const amount_t& amount_in,
    const route_t& route) const {
  const auto& [input_asset, output_asset] = route;
  if (!is_listed(input_asset, output_asset)) {
    return std::nullopt;
  }
  auto reserve_in = ledger_.balance_of(party_, input_asset);
  auto reserve_out = ledger_.balance_of(party_, output_asset);
  if (reserve_in == 0 || reserve_out == 0) {
    return std::nullopt;
  }
  return get_amount_out(amount_in, reserve_in, reserve_out, fee_ppk_);
}

venue_result_t constant_product_venue::execute_and_settle(
    const party_id_t& payer,
    const settlement_instruction_t& instruction) {
  auto now = clock_();
  if (now > instruction.expiry) {
    spdlog::warn("Settlement expired: now {} > expiry {}", now,
                 instruction.expiry);
    return swap_error_code::expired;
  }

  auto amount_out = quote(instruction.amount_in, instruction.route);
  if (!amount_out) {
    return swap_error_code::route_unavailable;
  }
  if (*amount_out == 0 || *amount_out < instruction.minimum_amount_out) {
    spdlog::warn("Settlement output {} below minimum {}",
                 swapguard::schema::to_string(*amount_out),
                 swapguard::schema::to_string(instruction.minimum_amount_out));
    return swap_error_code::slippage_exceeded;
  }

  const auto& [input_asset, output_asset] = instruction.route;
  auto pulled = ledger_.transfer_from(party_, payer, party_, input_asset,
                                      instruction.amount_in);
  if (pulled != ledger::ledger_status::ok) {
    spdlog::warn("Venue could not draw input from payer: {}",
                 ledger::to_string(pulled));
    return swap_error_code::authorization_denied;
  }
  auto paid = ledger_.transfer(party_, instruction.settlement_destination,
                               output_asset, *amount_out);
  if (paid != ledger::ledger_status::ok) {
    // The input draw above is staged in the caller's envelope and reverts
    // with it.
    spdlog::warn("Venue could not pay output: {}", ledger::to_string(paid));
    return swap_error_code::transfer_denied;
  }

  return settlement_outcome_t{.amount_out = *amount_out};
}

constant_product_venue::pair_key_t constant_product_venue::make_pair_key(
    const asset_id_t& a,
    const asset_id_t& b) {
  return a < b ? pair_key_t{a, b} : pair_key_t{b, a};
}

}  // namespace swapguard::exchange
