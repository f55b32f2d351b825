#pragma once
#include <swapguard/schema/primitives.hpp>

#include <array>

// Schema type: route.
// Direct two-asset hop: [input asset, output asset].
namespace swapguard::schema {

using route_t = std::array<asset_id_t, 2>;

inline route_t make_route(const asset_id_t& input_asset,
                          const asset_id_t& output_asset) {
  return route_t{input_asset, output_asset};
}

}  // namespace swapguard::schema
