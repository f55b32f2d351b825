#include <spdlog/spdlog.h>
#include <swapguard/execution/custody_intake.hpp>

using namespace swapguard::schema;

namespace swapguard::execution {

custody_intake::custody_intake(ledger::ledger& ledger,
                               const party_id_t& executing_party,
                               const party_id_t& venue_party)
    : ledger_{ledger},
      executing_party_{executing_party},
      venue_party_{venue_party} {}

std::optional<swap_error_code> custody_intake::acquire(
    const party_id_t& caller,
    const asset_id_t& input_asset,
    const amount_t& amount_in) {
  if (amount_in == 0) {
    return swap_error_code::invalid_amount;
  }

  auto pulled = ledger_.transfer_from(executing_party_, caller,
                                      executing_party_, input_asset, amount_in);
  if (pulled != ledger::ledger_status::ok) {
    spdlog::warn("Custody intake could not pull {} from caller {}: {}",
                 swapguard::schema::to_string(amount_in), to_hex(caller),
                 ledger::to_string(pulled));
    return swap_error_code::transfer_denied;
  }

  auto granted = ledger_.raise_authorization(executing_party_, venue_party_,
                                             input_asset, amount_in);
  if (granted != ledger::ledger_status::ok) {
    spdlog::warn("Custody intake could not authorize venue {}: {}",
                 to_hex(venue_party_), ledger::to_string(granted));
    return swap_error_code::authorization_denied;
  }

  spdlog::debug("Custody intake holds {} of asset {}",
                swapguard::schema::to_string(amount_in), to_hex(input_asset));
  return std::nullopt;
}

}  // namespace swapguard::execution
