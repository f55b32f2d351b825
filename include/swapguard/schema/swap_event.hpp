#pragma once

#include <swapguard/schema/swap_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: swap event.
// Emitted once per invocation ("swap_settled" or "swap_aborted").
namespace swapguard::schema {

template <uint16_t Version>
struct swap_event;

template <>
struct swap_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<swap_event_attribute_t> attributes;
};

using swap_event_t = swap_event<1>;

}  // namespace swapguard::schema
