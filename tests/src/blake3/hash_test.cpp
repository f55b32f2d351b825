#include <gtest/gtest.h>
#include <swapguard/blake3/hash.hpp>

#include <string_view>

TEST(blake3, hash_of_empty_input_matches_reference) {
  EXPECT_EQ(swapguard::schema::to_hex(swapguard::blake3::hash(
                std::string_view{})),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3, string_and_byte_views_hash_alike) {
  auto label = std::string_view{"asset-in"};
  EXPECT_EQ(swapguard::blake3::hash(label),
            swapguard::blake3::hash(swapguard::schema::make_bytes_view(label)));
  EXPECT_NE(swapguard::blake3::hash(label),
            swapguard::blake3::hash(std::string_view{"asset-out"}));
}

TEST(blake3, fold_hashes_seed_then_material) {
  auto seed = swapguard::schema::make_hash32(swapguard::schema::bytes_t(32, 7));
  auto material = swapguard::schema::bytes_t{0x01, 0x02, 0x03};

  auto concatenated = swapguard::schema::bytes_t{std::begin(seed), std::end(seed)};
  concatenated.insert(std::end(concatenated), std::begin(material),
                      std::end(material));

  EXPECT_EQ(swapguard::blake3::fold(
                seed, swapguard::schema::make_bytes_view(material)),
            swapguard::blake3::hash(
                swapguard::schema::make_bytes_view(concatenated)));
  EXPECT_NE(swapguard::blake3::fold(
                swapguard::schema::make_zero_hash(),
                swapguard::schema::make_bytes_view(material)),
            swapguard::blake3::fold(
                seed, swapguard::schema::make_bytes_view(material)));
}
