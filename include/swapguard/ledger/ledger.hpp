#pragma once

#include <swapguard/schema/enum_string.hpp>
#include <swapguard/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace swapguard::ledger {

enum class ledger_status : uint8_t {
  ok = 0,
  insufficient_balance = 1,
  not_authorized = 2,
  invalid_party = 3,
  overflow = 4,
};

inline constexpr auto kLedgerStatusMappings = std::array{
    std::pair<std::string_view, ledger_status>{"ok", ledger_status::ok},
    std::pair<std::string_view, ledger_status>{
        "insufficient_balance", ledger_status::insufficient_balance},
    std::pair<std::string_view, ledger_status>{"not_authorized",
                                               ledger_status::not_authorized},
    std::pair<std::string_view, ledger_status>{"invalid_party",
                                               ledger_status::invalid_party},
    std::pair<std::string_view, ledger_status>{"overflow",
                                               ledger_status::overflow}};

inline constexpr std::string_view to_string(const ledger_status value) {
  return swapguard::schema::to_string(value, kLedgerStatusMappings)
      .value_or("unknown");
}

/// Asset-transfer ledger consumed by custody intake and exchange venues.
///
/// Every operation either applies completely or returns a failure status
/// without mutating anything. Allowances are keyed by (owner, spender, asset)
/// and only change through `authorize` and `transfer_from`.
class ledger {
 public:
  virtual ~ledger() = default;

  virtual swapguard::schema::amount_t balance_of(
      const swapguard::schema::party_id_t& holder,
      const swapguard::schema::asset_id_t& asset) const = 0;

  virtual swapguard::schema::amount_t allowance(
      const swapguard::schema::party_id_t& owner,
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::asset_id_t& asset) const = 0;

  /// Move `amount` of `asset` owned by `from` into the custody of `to`.
  virtual ledger_status transfer(const swapguard::schema::party_id_t& from,
                                 const swapguard::schema::party_id_t& to,
                                 const swapguard::schema::asset_id_t& asset,
                                 const swapguard::schema::amount_t& amount) = 0;

  /// Move funds of `from` on behalf of `spender`, consuming the allowance
  /// `from` granted to `spender`.
  virtual ledger_status transfer_from(
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::party_id_t& from,
      const swapguard::schema::party_id_t& to,
      const swapguard::schema::asset_id_t& asset,
      const swapguard::schema::amount_t& amount) = 0;

  /// Set the amount `spender` may draw from `owner` in `asset`.
  virtual ledger_status authorize(
      const swapguard::schema::party_id_t& owner,
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::asset_id_t& asset,
      const swapguard::schema::amount_t& amount) = 0;

  /// Ensure `spender` may draw at least `minimum` from `owner` in `asset`.
  /// A larger existing allowance is left as it is.
  virtual ledger_status raise_authorization(
      const swapguard::schema::party_id_t& owner,
      const swapguard::schema::party_id_t& spender,
      const swapguard::schema::asset_id_t& asset,
      const swapguard::schema::amount_t& minimum) = 0;
};

}  // namespace swapguard::ledger
