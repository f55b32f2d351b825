#pragma once

#include <swapguard/schema/primitives.hpp>
#include <swapguard/schema/settlement_outcome.hpp>
#include <swapguard/schema/swap_event.hpp>
#include <swapguard/schema/swap_status.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swapguard::schema {

template <uint16_t Version>
struct swap_result;

template <>
struct swap_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  swap_status_t status{swap_status_t::pending};
  hash32_t request_id{};
  uint64_t sequence{};
  std::optional<settlement_outcome_t> outcome;
  std::vector<swap_event_t> events;
};

using swap_result_t = swap_result<1>;

}  // namespace swapguard::schema
