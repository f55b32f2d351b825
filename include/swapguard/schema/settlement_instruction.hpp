#pragma once
#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/route.hpp>

// Schema type: settlement instruction.
// Arguments of one execute-and-settle call on an exchange venue.
namespace swapguard::schema {

template <uint16_t Version>
struct settlement_instruction;

template <>
struct settlement_instruction<1> final {
  uint16_t version{1};
  amount_t amount_in{};
  amount_t minimum_amount_out{};
  route_t route{};
  party_id_t settlement_destination{};
  timestamp_milliseconds_t expiry{};
};

using settlement_instruction_t = settlement_instruction<1>;

}  // namespace swapguard::schema
