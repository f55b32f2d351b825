#include <spdlog/spdlog.h>
#include <swapguard/common/critical.hpp>
#include <swapguard/execution/guarded_executor.hpp>
#include <swapguard/schema/route.hpp>

using namespace swapguard::schema;

namespace swapguard::execution {

guarded_executor::guarded_executor(
    exchange::venue& venue,
    const party_id_t& executing_party,
    exchange::clock_source_t clock,
    const duration_milliseconds_t expiry_tolerance)
    : venue_{venue},
      executing_party_{executing_party},
      clock_{std::move(clock)},
      expiry_tolerance_{expiry_tolerance} {
  if (!clock_) {
    swapguard::common::critical("guarded executor requires a clock source");
  }
}

exchange::venue_result_t guarded_executor::execute(
    const swap_request_t& request) {
  auto instruction = make_instruction(request, clock_() + expiry_tolerance_);
  spdlog::debug("Settling {} for minimum {} expiring at {}",
                swapguard::schema::to_string(instruction.amount_in),
                swapguard::schema::to_string(instruction.minimum_amount_out),
                instruction.expiry);
  return venue_.execute_and_settle(executing_party_, instruction);
}

settlement_instruction_t guarded_executor::make_instruction(
    const swap_request_t& request,
    const timestamp_milliseconds_t expiry) {
  return settlement_instruction_t{
      .amount_in = request.amount_in,
      .minimum_amount_out = request.minimum_amount_out,
      .route = make_route(request.input_asset, request.output_asset),
      .settlement_destination = request.caller,
      .expiry = expiry};
}

}  // namespace swapguard::execution
