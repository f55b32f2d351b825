#pragma once

#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/route.hpp>
#include <swapguard/schema/settlement_instruction.hpp>
#include <swapguard/schema/settlement_outcome.hpp>
#include <swapguard/schema/swap_error_code.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <variant>

namespace swapguard::exchange {

/// Source of the current time in milliseconds since the epoch.
using clock_source_t = std::function<swapguard::schema::timestamp_milliseconds_t()>;

inline clock_source_t system_clock_source() {
  return [] {
    return static_cast<swapguard::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

/// Clock that always reports `now`.
inline clock_source_t fixed_clock_source(
    const swapguard::schema::timestamp_milliseconds_t now) {
  return [now] { return now; };
}

/// Either the settled output or the reason the venue refused to settle.
using venue_result_t = std::variant<swapguard::schema::settlement_outcome_t,
                                    swapguard::schema::swap_error_code>;

/// Exchange venue consumed by the guarded executor.
class venue {
 public:
  virtual ~venue() = default;

  /// Party whose allowance the venue draws on during settlement.
  virtual const swapguard::schema::party_id_t& party() const = 0;

  /// Output the venue would pay for `amount_in` along `route` right now, or
  /// std::nullopt when the route cannot be priced.
  virtual std::optional<swapguard::schema::amount_t> quote(
      const swapguard::schema::amount_t& amount_in,
      const swapguard::schema::route_t& route) const = 0;

  /// Draw `instruction.amount_in` from `payer` and pay the output to
  /// `instruction.settlement_destination`, or refuse without side effects.
  ///
  /// Refusals: `expired` once the venue clock is past `instruction.expiry`,
  /// `route_unavailable` when the pair cannot be priced,
  /// `slippage_exceeded` when the output would fall below
  /// `instruction.minimum_amount_out`.
  virtual venue_result_t execute_and_settle(
      const swapguard::schema::party_id_t& payer,
      const swapguard::schema::settlement_instruction_t& instruction) = 0;
};

}  // namespace swapguard::exchange
