#pragma once

#include <swapguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: swap status.
// Per-invocation lifecycle: pending until the envelope resolves, then exactly
// one of the terminal states.
namespace swapguard::schema {

enum class swap_status_t : uint8_t {
  pending = 0,
  settled = 1,
  aborted = 2,
};

inline constexpr auto kSwapStatusMappings = std::array{
    std::pair<std::string_view, swap_status_t>{"pending",
                                               swap_status_t::pending},
    std::pair<std::string_view, swap_status_t>{"settled",
                                               swap_status_t::settled},
    std::pair<std::string_view, swap_status_t>{"aborted",
                                               swap_status_t::aborted}};

template <>
inline std::optional<swap_status_t> try_from_string<swap_status_t>(
    const std::string_view value) {
  return from_string(value, kSwapStatusMappings);
}

inline constexpr std::string_view to_string(const swap_status_t value) {
  return to_string(value, kSwapStatusMappings).value_or("unknown");
}

}  // namespace swapguard::schema
