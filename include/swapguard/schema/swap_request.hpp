#pragma once
#include <swapguard/schema/primitives.hpp>

// Schema type: swap request.
// One caller invocation: created from caller arguments plus configured assets
// and immutable while the invocation runs. `minimum_amount_out` belongs to the
// caller and is forwarded to the venue untouched.
namespace swapguard::schema {

template <uint16_t Version>
struct swap_request;

template <>
struct swap_request<1> final {
  uint16_t version{1};
  asset_id_t input_asset{};
  asset_id_t output_asset{};
  amount_t amount_in{};
  amount_t minimum_amount_out{};
  party_id_t caller{};
};

using swap_request_t = swap_request<1>;

}  // namespace swapguard::schema
