#pragma once

#include <swapguard/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace swapguard::testing {

inline swapguard::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = swapguard::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline const swapguard::schema::party_id_t& caller_party() {
  static const auto party = make_hash(1);
  return party;
}

inline const swapguard::schema::party_id_t& executing_party() {
  static const auto party = make_hash(40);
  return party;
}

inline const swapguard::schema::party_id_t& venue_party() {
  static const auto party = make_hash(80);
  return party;
}

inline const swapguard::schema::asset_id_t& input_asset() {
  static const auto asset = make_hash(120);
  return asset;
}

inline const swapguard::schema::asset_id_t& output_asset() {
  static const auto asset = make_hash(160);
  return asset;
}

}  // namespace swapguard::testing
