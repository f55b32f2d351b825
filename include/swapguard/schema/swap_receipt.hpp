#pragma once

#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/swap_status.hpp>
#include <cstdint>

// Schema type: swap receipt.
// Audit row written once per invocation after the envelope resolves. Amounts
// are stored in their 32-byte big-endian form.
namespace swapguard::schema {

template <uint16_t Version>
struct swap_receipt;

template <>
struct swap_receipt<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  hash32_t request_id{};
  party_id_t caller{};
  asset_id_t input_asset{};
  asset_id_t output_asset{};
  amount_bytes_t amount_in{};
  amount_bytes_t minimum_amount_out{};
  amount_bytes_t amount_out{};
  swap_status_t status{swap_status_t::pending};
  uint32_t code{};
  timestamp_milliseconds_t executed_at{};
};

using swap_receipt_t = swap_receipt<1>;

}  // namespace swapguard::schema
