#include <gtest/gtest.h>
#include <swapguard/blake3/hash.hpp>
#include <swapguard/exchange/constant_product_venue.hpp>
#include <swapguard/execution/engine.hpp>
#include <swapguard/testing/common.hpp>
#include <swapguard/testing/engine_fixture.hpp>
#include <swapguard/testing/ledger_fixture.hpp>
#include <swapguard/testing/stepping_clock.hpp>

#include <limits>
#include <thread>
#include <vector>

namespace {

using swapguard::schema::amount_t;
using swapguard::schema::swap_error_code;
using swapguard::schema::swap_status_t;
using swapguard::testing::caller_party;
using swapguard::testing::executing_party;
using swapguard::testing::input_asset;
using swapguard::testing::output_asset;
using swapguard::testing::venue_party;

void expect_aborted(const swapguard::schema::swap_result_t& result,
                    const swap_error_code code) {
  EXPECT_EQ(result.code, swapguard::schema::to_code(code));
  EXPECT_EQ(result.log, swapguard::schema::to_string(code));
  EXPECT_EQ(result.codespace, "swapguard.swap");
  EXPECT_EQ(result.status, swap_status_t::aborted);
  EXPECT_FALSE(result.outcome.has_value());
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events.front().type, "swap_aborted");
}

}  // namespace

TEST(engine_integration, settles_achievable_output_with_zero_minimum) {
  auto fixture = swapguard::testing::engine_fixture{"swapguard_engine_990", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.status, swap_status_t::settled);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_EQ(result.outcome->amount_out, amount_t{990});
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events.front().type, "swap_settled");

  auto& ledger = fixture.ledger();
  EXPECT_EQ(ledger.balance_of(caller_party(), input_asset()), amount_t{0});
  EXPECT_EQ(ledger.balance_of(caller_party(), output_asset()), amount_t{990});
  EXPECT_EQ(ledger.balance_of(executing_party(), input_asset()), amount_t{0});
  EXPECT_EQ(ledger.balance_of(venue_party(), input_asset()), amount_t{1000});
  EXPECT_EQ(ledger.balance_of(venue_party(), output_asset()), amount_t{9010});
  EXPECT_EQ(ledger.allowance(executing_party(), venue_party(), input_asset()),
            amount_t{0});
}

TEST(engine_integration, minimum_above_achievable_aborts_with_slippage) {
  auto fixture = swapguard::testing::engine_fixture{"swapguard_engine_995", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  auto before = fixture.snapshot();

  auto result = fixture.engine().swap(caller_party(), 1000, 995);

  expect_aborted(result, swap_error_code::slippage_exceeded);
  EXPECT_EQ(result.info, "no balances were changed");
  EXPECT_EQ(fixture.snapshot(), before);
}

TEST(engine_integration, minimum_equal_to_achievable_settles) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_exact", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);

  auto result = fixture.engine().swap(caller_party(), 1000, 990);

  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_GE(result.outcome->amount_out, amount_t{990});
  EXPECT_EQ(fixture.ledger().balance_of(caller_party(), output_asset()),
            amount_t{990});
}

TEST(engine_integration, venue_sees_every_caller_minimum) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_passthrough", 990};
  fixture.fund_caller(3000);
  fixture.fund_venue(10'000);

  (void)fixture.engine().swap(caller_party(), 1000, 0);
  (void)fixture.engine().swap(caller_party(), 1000, 995);
  (void)fixture.engine().swap(caller_party(), 1000, 990);

  const auto& instructions = fixture.venue().instructions();
  ASSERT_EQ(instructions.size(), 3u);
  EXPECT_EQ(instructions[0].minimum_amount_out, amount_t{0});
  EXPECT_EQ(instructions[1].minimum_amount_out, amount_t{995});
  EXPECT_EQ(instructions[2].minimum_amount_out, amount_t{990});
  for (const auto& instruction : instructions) {
    EXPECT_EQ(instruction.settlement_destination, caller_party());
    EXPECT_EQ(instruction.route[0], input_asset());
    EXPECT_EQ(instruction.route[1], output_asset());
  }
}

TEST(engine_integration, missing_caller_authorization_is_transfer_denied) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_no_auth", 990};
  ASSERT_EQ(fixture.ledger().credit(caller_party(), input_asset(), 1000),
            swapguard::ledger::ledger_status::ok);
  fixture.fund_venue(10'000);
  auto before = fixture.snapshot();

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  expect_aborted(result, swap_error_code::transfer_denied);
  EXPECT_EQ(fixture.snapshot(), before);
  EXPECT_TRUE(fixture.venue().instructions().empty());
}

TEST(engine_integration, zero_amount_is_rejected_before_any_mutation) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_zero", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  auto before = fixture.snapshot();

  auto result = fixture.engine().swap(caller_party(), 0, 0);

  expect_aborted(result, swap_error_code::invalid_amount);
  EXPECT_EQ(fixture.snapshot(), before);
  EXPECT_TRUE(fixture.venue().instructions().empty());
}

TEST(engine_integration, unavailable_route_reverts_custody_intake) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_route", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  fixture.venue().set_available(false);
  auto before = fixture.snapshot();

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  expect_aborted(result, swap_error_code::route_unavailable);
  EXPECT_EQ(fixture.snapshot(), before);
  EXPECT_EQ(fixture.venue().instructions().size(), 1u);
}

TEST(engine_integration, venue_payout_failure_reverts_the_input_draw) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_payout", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(500);
  auto before = fixture.snapshot();

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  expect_aborted(result, swap_error_code::transfer_denied);
  EXPECT_EQ(fixture.snapshot(), before);
}

TEST(engine_integration, settlement_after_expiry_is_expired) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_expired", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  auto before = fixture.snapshot();
  // Each clock reading is one millisecond later, so the venue always reads a
  // time past the expiry computed by the executor.
  fixture.clock().set_step(1);

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  expect_aborted(result, swap_error_code::expired);
  EXPECT_EQ(fixture.snapshot(), before);
}

TEST(engine_integration, expiry_tolerance_absorbs_clock_drift) {
  auto fixture = swapguard::testing::engine_fixture{
      "swapguard_engine_tolerance", 990, 5};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  fixture.clock().set_step(1);

  auto result = fixture.engine().swap(caller_party(), 1000, 0);

  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(fixture.ledger().balance_of(caller_party(), output_asset()),
            amount_t{990});
}

TEST(engine_integration, venue_authorization_failure_reverts_custody_intake) {
  auto fixture =
      swapguard::testing::ledger_fixture{"swapguard_engine_venue_auth"};
  auto clock = swapguard::testing::stepping_clock{};
  // The ledger refuses allowances for the zero party.
  auto venue = swapguard::testing::fixed_rate_venue{
      fixture.ledger(), swapguard::schema::make_zero_hash(), clock.source(),
      990};
  auto engine = swapguard::execution::engine{
      fixture.encoder(), fixture.storage(), fixture.ledger(),
      venue, swapguard::testing::make_engine_config(), clock.source()};
  fixture.fund_caller(1000);
  auto before = fixture.snapshot();

  auto result = engine.swap(caller_party(), 1000, 0);

  expect_aborted(result, swap_error_code::authorization_denied);
  EXPECT_EQ(fixture.snapshot(), before);
  EXPECT_TRUE(venue.instructions().empty());
}

TEST(engine_integration, identical_assets_are_invalid) {
  auto fixture =
      swapguard::testing::ledger_fixture{"swapguard_engine_same_asset"};
  auto clock = swapguard::testing::stepping_clock{};
  auto venue = swapguard::testing::fixed_rate_venue{
      fixture.ledger(), venue_party(), clock.source(), 990};
  auto config = swapguard::testing::make_engine_config();
  config.output_asset = config.input_asset;
  auto engine = swapguard::execution::engine{
      fixture.encoder(), fixture.storage(), fixture.ledger(),
      venue, config, clock.source()};
  fixture.fund_caller(1000);
  auto before = fixture.snapshot();

  expect_aborted(engine.swap(caller_party(), 1000, 0),
                 swap_error_code::invalid_amount);
  EXPECT_EQ(fixture.snapshot(), before);
}

TEST(engine_integration, receipts_record_settled_and_aborted_swaps) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_receipts", 990};
  fixture.fund_caller(2000);
  fixture.fund_venue(10'000);

  auto settled = fixture.engine().swap(caller_party(), 1000, 0);
  auto aborted = fixture.engine().swap(caller_party(), 1000, 995);
  EXPECT_EQ(settled.sequence, 1u);
  EXPECT_EQ(aborted.sequence, 2u);
  EXPECT_NE(settled.request_id, aborted.request_id);

  auto receipts = fixture.engine().history(1, 10);
  ASSERT_EQ(receipts.size(), 2u);
  EXPECT_EQ(receipts[0].sequence, 1u);
  EXPECT_EQ(receipts[0].request_id, settled.request_id);
  EXPECT_EQ(receipts[0].status, swap_status_t::settled);
  EXPECT_EQ(receipts[0].code, 0u);
  EXPECT_EQ(swapguard::schema::decode_amount(receipts[0].amount_out),
            amount_t{990});
  EXPECT_EQ(receipts[1].status, swap_status_t::aborted);
  EXPECT_EQ(receipts[1].code,
            swapguard::schema::to_code(swap_error_code::slippage_exceeded));
  EXPECT_EQ(swapguard::schema::decode_amount(receipts[1].minimum_amount_out),
            amount_t{995});
  EXPECT_EQ(swapguard::schema::decode_amount(receipts[1].amount_out),
            amount_t{0});
  EXPECT_EQ(receipts[1].caller, caller_party());

  EXPECT_EQ(fixture.engine().history(2, 2).size(), 1u);
  EXPECT_TRUE(fixture.engine().history(3, 10).empty());
}

TEST(engine_integration, history_is_ordered_past_one_byte_of_sequence) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_history_order", 990};
  fixture.fund_caller(1000);
  fixture.fund_venue(10'000);
  for (auto i = 0; i < 260; ++i) {
    (void)fixture.engine().swap(caller_party(), 1000, 995);
  }

  auto receipts = fixture.engine().history(250, 300);
  ASSERT_EQ(receipts.size(), 11u);
  for (auto i = std::size_t{0}; i < receipts.size(); ++i) {
    EXPECT_EQ(receipts[i].sequence, 250u + i);
  }
  EXPECT_EQ(fixture.engine().history(0, 1).size(), 1u);
}

TEST(engine_integration, state_root_folds_receipts_and_survives_restart) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_root", 990};
  fixture.fund_caller(2000);
  fixture.fund_venue(10'000);
  EXPECT_EQ(fixture.engine().info().sequence, 0u);
  EXPECT_EQ(fixture.engine().info().state_root,
            swapguard::schema::make_zero_hash());

  (void)fixture.engine().swap(caller_party(), 1000, 0);
  (void)fixture.engine().swap(caller_party(), 1000, 995);

  auto expected = swapguard::schema::make_zero_hash();
  for (const auto& receipt : fixture.engine().history(1, 2)) {
    auto encoded = fixture.encoder().encode(receipt);
    expected = swapguard::blake3::fold(
        expected, swapguard::schema::make_bytes_view(encoded));
  }
  auto info = fixture.engine().info();
  EXPECT_EQ(info.sequence, 2u);
  EXPECT_EQ(info.state_root, expected);

  fixture.restart();
  EXPECT_EQ(fixture.engine().info().sequence, 2u);
  EXPECT_EQ(fixture.engine().info().state_root, expected);
  EXPECT_EQ(fixture.engine().swap(caller_party(), 1, 1'000'000).sequence, 3u);
}

TEST(engine_integration, quotes_and_settles_against_constant_product_pool) {
  auto fixture = swapguard::testing::ledger_fixture{"swapguard_engine_pool"};
  auto& ledger = fixture.ledger();
  auto clock = swapguard::testing::stepping_clock{};
  auto venue = swapguard::exchange::constant_product_venue{
      ledger, venue_party(), clock.source()};
  venue.list_pair(input_asset(), output_asset());
  ASSERT_EQ(ledger.credit(venue_party(), input_asset(), 100'000),
            swapguard::ledger::ledger_status::ok);
  ASSERT_EQ(ledger.credit(venue_party(), output_asset(), 100'000),
            swapguard::ledger::ledger_status::ok);
  auto engine = swapguard::execution::engine{
      fixture.encoder(), fixture.storage(), ledger,
      venue, swapguard::testing::make_engine_config(), clock.source()};
  fixture.fund_caller(2000);

  EXPECT_EQ(engine.quote(1000), amount_t{987});

  auto before = fixture.snapshot();
  expect_aborted(engine.swap(caller_party(), 1000, 988),
                 swap_error_code::slippage_exceeded);
  EXPECT_EQ(fixture.snapshot(), before);

  auto result = engine.swap(caller_party(), 1000, 987);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_EQ(result.outcome->amount_out, amount_t{987});
  EXPECT_EQ(ledger.balance_of(caller_party(), output_asset()), amount_t{987});
  EXPECT_EQ(ledger.balance_of(venue_party(), input_asset()),
            amount_t{101'000});
  // The pool moved, so the same input now buys less.
  EXPECT_LT(*engine.quote(1000), amount_t{987});
}

TEST(engine_integration, concurrent_swaps_are_serialized) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_threads", 9};
  fixture.fund_caller(200);
  fixture.fund_venue(10'000);

  auto threads = std::vector<std::thread>{};
  for (auto t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (auto i = 0; i < 5; ++i) {
        EXPECT_EQ(fixture.engine().swap(caller_party(), 10, 9).code, 0u);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(fixture.engine().info().sequence, 20u);
  EXPECT_EQ(fixture.ledger().balance_of(caller_party(), input_asset()),
            amount_t{0});
  EXPECT_EQ(fixture.ledger().balance_of(caller_party(), output_asset()),
            amount_t{180});
  EXPECT_EQ(fixture.engine().history(1, 20).size(), 20u);
}

TEST(engine_integration, standing_venue_grant_survives_settlement) {
  auto fixture =
      swapguard::testing::engine_fixture{"swapguard_engine_standing", 990};
  auto max = std::numeric_limits<amount_t>::max();
  fixture.fund_caller(2000);
  fixture.fund_venue(10'000);
  ASSERT_EQ(fixture.ledger().authorize(executing_party(), venue_party(),
                                       input_asset(), max),
            swapguard::ledger::ledger_status::ok);

  EXPECT_EQ(fixture.engine().swap(caller_party(), 1000, 0).code, 0u);
  EXPECT_EQ(fixture.ledger().allowance(executing_party(), venue_party(),
                                       input_asset()),
            max);
  EXPECT_EQ(fixture.engine().swap(caller_party(), 1000, 0).code, 0u);
  EXPECT_EQ(fixture.ledger().allowance(executing_party(), venue_party(),
                                       input_asset()),
            max);
  EXPECT_EQ(fixture.ledger().balance_of(caller_party(), output_asset()),
            amount_t{1980});
}

TEST(engine_integration, pinned_clock_settles_with_zero_tolerance) {
  auto fixture =
      swapguard::testing::ledger_fixture{"swapguard_engine_pinned_clock"};
  auto& ledger = fixture.ledger();
  ASSERT_EQ(ledger.credit(venue_party(), input_asset(), 100'000),
            swapguard::ledger::ledger_status::ok);
  ASSERT_EQ(ledger.credit(venue_party(), output_asset(), 100'000),
            swapguard::ledger::ledger_status::ok);
  fixture.fund_caller(2000);

  // Separate readings that move between expiry and settlement expire.
  auto drifting = swapguard::testing::stepping_clock{1'000, 1};
  auto drifting_venue = swapguard::exchange::constant_product_venue{
      ledger, venue_party(), drifting.source()};
  drifting_venue.list_pair(input_asset(), output_asset());
  auto drifting_engine = swapguard::execution::engine{
      fixture.encoder(), fixture.storage(), ledger, drifting_venue,
      swapguard::testing::make_engine_config(0), drifting.source()};
  auto before = fixture.snapshot();
  expect_aborted(drifting_engine.swap(caller_party(), 1000, 0),
                 swap_error_code::expired);
  EXPECT_EQ(fixture.snapshot(), before);

  auto pinned = swapguard::exchange::fixed_clock_source(1'000);
  auto pinned_venue = swapguard::exchange::constant_product_venue{
      ledger, venue_party(), pinned};
  pinned_venue.list_pair(input_asset(), output_asset());
  auto pinned_engine = swapguard::execution::engine{
      fixture.encoder(), fixture.storage(), ledger, pinned_venue,
      swapguard::testing::make_engine_config(0), pinned};
  auto result = pinned_engine.swap(caller_party(), 1000, 0);
  EXPECT_EQ(result.status, swap_status_t::settled);
  ASSERT_TRUE(result.outcome.has_value());
  EXPECT_EQ(result.outcome->amount_out, amount_t{987});
}
