#include <blake3.h>
#include <swapguard/blake3/hash.hpp>

namespace swapguard::blake3 {

swapguard::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = swapguard::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

swapguard::schema::hash32_t hash(const swapguard::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = swapguard::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

swapguard::schema::hash32_t fold(
    const swapguard::schema::hash32_t& seed,
    const swapguard::schema::bytes_view_t& material) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, seed.data(), seed.size());
  blake3_hasher_update(&hasher, material.data(), material.size());
  auto output = swapguard::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace swapguard::blake3
