#pragma once
#include <swapguard/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace swapguard::blake3 {

swapguard::schema::hash32_t hash(const std::string_view& str);
swapguard::schema::hash32_t hash(const swapguard::schema::bytes_view_t& bytes);

/// Hash `seed || material` into a new 32-byte digest.
swapguard::schema::hash32_t fold(const swapguard::schema::hash32_t& seed,
                                 const swapguard::schema::bytes_view_t& material);

}  // namespace swapguard::blake3
