#pragma once

#include <swapguard/exchange/venue.hpp>
#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/settlement_instruction.hpp>
#include <swapguard/schema/swap_request.hpp>

namespace swapguard::execution {

/// Hands a custody-held swap request to the venue with the caller's output
/// bound.
///
/// The venue receives `request.minimum_amount_out` exactly as the caller sent
/// it, the two-asset route, the caller as settlement destination, and an
/// expiry of the invocation time plus `expiry_tolerance`.
class guarded_executor final {
 public:
  guarded_executor(swapguard::exchange::venue& venue,
                   const swapguard::schema::party_id_t& executing_party,
                   swapguard::exchange::clock_source_t clock,
                   swapguard::schema::duration_milliseconds_t
                       expiry_tolerance = 0);

  swapguard::exchange::venue_result_t execute(
      const swapguard::schema::swap_request_t& request);

  /// Build the venue call for `request` expiring at `expiry`.
  static swapguard::schema::settlement_instruction_t make_instruction(
      const swapguard::schema::swap_request_t& request,
      swapguard::schema::timestamp_milliseconds_t expiry);

 private:
  swapguard::exchange::venue& venue_;
  swapguard::schema::party_id_t executing_party_;
  swapguard::exchange::clock_source_t clock_;
  swapguard::schema::duration_milliseconds_t expiry_tolerance_{};
};

}  // namespace swapguard::execution
