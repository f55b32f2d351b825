#pragma once

#include <cstdint>
#include <string>

// Schema type: swap event attribute.
// Key/value/index tuple carried by swap events.
namespace swapguard::schema {

template <uint16_t Version>
struct swap_event_attribute;

template <>
struct swap_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using swap_event_attribute_t = swap_event_attribute<1>;

}  // namespace swapguard::schema
