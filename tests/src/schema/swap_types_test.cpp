#include <gtest/gtest.h>
#include <swapguard/schema/encoding/scale/encoder.hpp>
#include <swapguard/schema/key/engine_keys.hpp>
#include <swapguard/schema/route.hpp>
#include <swapguard/schema/swap_error_code.hpp>
#include <swapguard/schema/swap_receipt.hpp>
#include <swapguard/schema/swap_result.hpp>
#include <swapguard/schema/swap_status.hpp>
#include <swapguard/testing/common.hpp>

namespace {

using encoder_t = swapguard::schema::encoding::encoder<
    swapguard::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(swap_types, error_codes_are_stable) {
  using swapguard::schema::swap_error_code;
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::invalid_amount), 1u);
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::transfer_denied), 2u);
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::authorization_denied),
            3u);
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::slippage_exceeded),
            4u);
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::expired), 5u);
  EXPECT_EQ(swapguard::schema::to_code(swap_error_code::route_unavailable),
            6u);
}

TEST(swap_types, error_codes_map_to_names) {
  using swapguard::schema::swap_error_code;
  EXPECT_EQ(swapguard::schema::to_string(swap_error_code::slippage_exceeded),
            "slippage_exceeded");
  EXPECT_EQ(swapguard::schema::try_from_string<swap_error_code>("expired"),
            swap_error_code::expired);
  EXPECT_FALSE(swapguard::schema::try_from_string<swap_error_code>("ok")
                   .has_value());
}

TEST(swap_types, status_names_and_defaults) {
  using swapguard::schema::swap_status_t;
  EXPECT_EQ(swapguard::schema::to_string(swap_status_t::settled), "settled");
  EXPECT_EQ(swapguard::schema::to_string(swap_status_t::aborted), "aborted");

  auto result = swapguard::schema::swap_result_t{};
  EXPECT_EQ(result.version, 1u);
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.status, swap_status_t::pending);
  EXPECT_FALSE(result.outcome.has_value());
}

TEST(swap_types, route_is_input_then_output) {
  auto in = swapguard::testing::input_asset();
  auto out = swapguard::testing::output_asset();
  auto route = swapguard::schema::make_route(in, out);
  EXPECT_EQ(route[0], in);
  EXPECT_EQ(route[1], out);
}

TEST(swap_types, receipt_survives_scale_encoding) {
  auto encoder = encoder_t{};
  auto receipt = swapguard::schema::swap_receipt_t{
      .sequence = 7,
      .request_id = swapguard::testing::make_hash(9),
      .caller = swapguard::testing::caller_party(),
      .input_asset = swapguard::testing::input_asset(),
      .output_asset = swapguard::testing::output_asset(),
      .amount_in = swapguard::schema::encode_amount(1000),
      .minimum_amount_out = swapguard::schema::encode_amount(995),
      .amount_out = swapguard::schema::encode_amount(0),
      .status = swapguard::schema::swap_status_t::aborted,
      .code = 4,
      .executed_at = 1'000};

  auto encoded = encoder.encode(receipt);
  auto decoded = encoder.decode<swapguard::schema::swap_receipt_t>(
      swapguard::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.sequence, 7u);
  EXPECT_EQ(decoded.request_id, receipt.request_id);
  EXPECT_EQ(decoded.status, swapguard::schema::swap_status_t::aborted);
  EXPECT_EQ(decoded.code, 4u);
  EXPECT_EQ(swapguard::schema::decode_amount(decoded.minimum_amount_out),
            swapguard::schema::amount_t{995});
  EXPECT_EQ(encoder.encode(decoded), encoded);
}

TEST(swap_types, history_keys_parse_back_to_sequence) {
  auto encoder = encoder_t{};
  auto key = swapguard::schema::key::make_history_key(encoder, 42);
  auto parsed = swapguard::schema::key::parse_history_key(
      encoder, swapguard::schema::make_bytes_view(key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, 42u);

  auto balance_key = swapguard::schema::key::make_balance_key(
      encoder, swapguard::testing::caller_party(),
      swapguard::testing::input_asset());
  EXPECT_FALSE(swapguard::schema::key::parse_history_key(
                   encoder, swapguard::schema::make_bytes_view(balance_key))
                   .has_value());
}

TEST(swap_types, balance_and_allowance_keys_do_not_collide) {
  auto encoder = encoder_t{};
  auto balance = swapguard::schema::key::make_balance_key(
      encoder, swapguard::testing::caller_party(),
      swapguard::testing::input_asset());
  auto allowance = swapguard::schema::key::make_allowance_key(
      encoder, swapguard::testing::caller_party(),
      swapguard::testing::executing_party(), swapguard::testing::input_asset());
  auto reversed = swapguard::schema::key::make_allowance_key(
      encoder, swapguard::testing::executing_party(),
      swapguard::testing::caller_party(), swapguard::testing::input_asset());
  EXPECT_NE(balance, allowance);
  EXPECT_NE(allowance, reversed);
}
