#pragma once

#include <swapguard/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: swap error code.
// Terminal failure taxonomy for one guarded swap invocation. Zero is reserved
// for success in result codes.
namespace swapguard::schema {

enum class swap_error_code : uint32_t {
  invalid_amount = 1,
  transfer_denied = 2,
  authorization_denied = 3,
  slippage_exceeded = 4,
  expired = 5,
  route_unavailable = 6,
};

inline constexpr auto kSwapErrorCodeMappings =
    std::array{std::pair<std::string_view, swap_error_code>{
                   "invalid_amount", swap_error_code::invalid_amount},
               std::pair<std::string_view, swap_error_code>{
                   "transfer_denied", swap_error_code::transfer_denied},
               std::pair<std::string_view, swap_error_code>{
                   "authorization_denied",
                   swap_error_code::authorization_denied},
               std::pair<std::string_view, swap_error_code>{
                   "slippage_exceeded", swap_error_code::slippage_exceeded},
               std::pair<std::string_view, swap_error_code>{
                   "expired", swap_error_code::expired},
               std::pair<std::string_view, swap_error_code>{
                   "route_unavailable", swap_error_code::route_unavailable}};

template <>
inline std::optional<swap_error_code> try_from_string<swap_error_code>(
    const std::string_view value) {
  return from_string(value, kSwapErrorCodeMappings);
}

inline constexpr std::string_view to_string(const swap_error_code value) {
  return to_string(value, kSwapErrorCodeMappings).value_or("unknown");
}

inline constexpr uint32_t to_code(const swap_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace swapguard::schema
