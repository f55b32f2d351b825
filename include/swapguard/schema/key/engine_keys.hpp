#pragma once

#include <swapguard/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for ledger balances, venue
// authorizations, and the swap audit trail.
namespace swapguard::schema::key {

inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kAllowanceKeyPrefix{"SYS|STATE|ALLOWANCE|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|SWAP|"};

template <typename Encoder, typename T>
swapguard::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
swapguard::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
swapguard::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const swapguard::schema::party_id_t& holder,
    const swapguard::schema::asset_id_t& asset) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{holder, asset});
}

template <typename Encoder>
swapguard::schema::bytes_t make_allowance_key(
    Encoder& encoder,
    const swapguard::schema::party_id_t& owner,
    const swapguard::schema::party_id_t& spender,
    const swapguard::schema::asset_id_t& asset) {
  return make_prefixed_key(encoder, kAllowanceKeyPrefix,
                           std::tuple{owner, spender, asset});
}

template <typename Encoder>
swapguard::schema::bytes_t make_history_key(Encoder& encoder,
                                            uint64_t sequence) {
  return make_prefixed_key(encoder, kHistoryPrefix, sequence);
}

template <typename Encoder>
std::optional<uint64_t> parse_history_key(
    Encoder& encoder,
    const swapguard::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kHistoryPrefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace swapguard::schema::key
