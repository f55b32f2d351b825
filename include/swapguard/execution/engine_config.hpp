#pragma once

#include <swapguard/schema/primitives.hpp>

namespace swapguard::execution {

/// Identifiers fixed when the engine is constructed.
struct engine_config final {
  swapguard::schema::party_id_t executing_party{};
  swapguard::schema::asset_id_t input_asset{};
  swapguard::schema::asset_id_t output_asset{};
  // Added to the invocation time to form the settlement expiry.
  swapguard::schema::duration_milliseconds_t expiry_tolerance_ms{0};
};

}  // namespace swapguard::execution
