#pragma once

#include <swapguard/ledger/ledger.hpp>
#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/swap_error_code.hpp>

#include <optional>

namespace swapguard::execution {

/// Moves a caller's input into the executing party's custody and authorizes
/// the venue to draw it.
///
/// Performs no compensation of its own: a failure after the first ledger step
/// is reported upward and reverted by the enclosing ledger transaction.
class custody_intake final {
 public:
  custody_intake(swapguard::ledger::ledger& ledger,
                 const swapguard::schema::party_id_t& executing_party,
                 const swapguard::schema::party_id_t& venue_party);

  /// Returns std::nullopt once the funds are held and the venue authorized.
  ///
  /// Each call draws `amount_in` again; it is meant to run exactly once per
  /// swap request.
  std::optional<swapguard::schema::swap_error_code> acquire(
      const swapguard::schema::party_id_t& caller,
      const swapguard::schema::asset_id_t& input_asset,
      const swapguard::schema::amount_t& amount_in);

  const swapguard::schema::party_id_t& executing_party() const {
    return executing_party_;
  }

 private:
  swapguard::ledger::ledger& ledger_;
  swapguard::schema::party_id_t executing_party_;
  swapguard::schema::party_id_t venue_party_;
};

}  // namespace swapguard::execution
