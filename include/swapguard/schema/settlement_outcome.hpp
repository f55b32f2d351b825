#pragma once
#include <swapguard/schema/primitives.hpp>

// Schema type: settlement outcome.
// Output of a venue settlement; amount_out is never below the caller bound.
namespace swapguard::schema {

template <uint16_t Version>
struct settlement_outcome;

template <>
struct settlement_outcome<1> final {
  uint16_t version{1};
  amount_t amount_out{};
};

using settlement_outcome_t = settlement_outcome<1>;

}  // namespace swapguard::schema
