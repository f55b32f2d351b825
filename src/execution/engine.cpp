#include <spdlog/spdlog.h>
#include <swapguard/blake3/hash.hpp>
#include <swapguard/common/critical.hpp>
#include <swapguard/execution/engine.hpp>
#include <swapguard/schema/key/engine_keys.hpp>
#include <swapguard/schema/route.hpp>
#include <swapguard/schema/swap_error_code.hpp>

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

using namespace swapguard::schema;

namespace {

inline constexpr auto kCodespace = std::string_view{"swapguard.swap"};

swap_event_t make_settled_event(const swap_request_t& request,
                                const hash32_t& request_id,
                                const amount_t& amount_out) {
  return swap_event_t{
      .type = "swap_settled",
      .attributes = {
          swap_event_attribute_t{
              .key = "request_id", .value = to_hex(request_id), .index = true},
          swap_event_attribute_t{
              .key = "caller", .value = to_hex(request.caller), .index = true},
          swap_event_attribute_t{
              .key = "amount_in",
              .value = swapguard::schema::to_string(request.amount_in)},
          swap_event_attribute_t{
              .key = "minimum_amount_out",
              .value = swapguard::schema::to_string(request.minimum_amount_out)},
          swap_event_attribute_t{
              .key = "amount_out",
              .value = swapguard::schema::to_string(amount_out)}}};
}

swap_event_t make_aborted_event(const swap_request_t& request,
                                const hash32_t& request_id,
                                const swap_error_code code) {
  return swap_event_t{
      .type = "swap_aborted",
      .attributes = {
          swap_event_attribute_t{
              .key = "request_id", .value = to_hex(request_id), .index = true},
          swap_event_attribute_t{
              .key = "caller", .value = to_hex(request.caller), .index = true},
          swap_event_attribute_t{
              .key = "reason",
              .value = std::string{swapguard::schema::to_string(code)}}}};
}

}  // namespace

namespace swapguard::execution {

engine::engine(encoding::encoder<encoding::scale_encoder_tag>& encoder,
               storage::storage<storage::rocksdb_storage_tag>& storage,
               ledger::state_ledger& ledger,
               exchange::venue& venue,
               engine_config config,
               exchange::clock_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      ledger_{ledger},
      venue_{venue},
      config_{std::move(config)},
      clock_{std::move(clock)},
      intake_{ledger, config_.executing_party, venue.party()},
      executor_{venue, config_.executing_party, clock_,
                config_.expiry_tolerance_ms} {
  auto lock = std::scoped_lock{mutex_};
  if (config_.executing_party == make_zero_hash()) {
    swapguard::common::critical("executing party is not configured");
  }
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }
  if (config_.expiry_tolerance_ms == 0) {
    spdlog::info("Expiry tolerance is 0; settlements expire at invocation");
  }
  spdlog::info("Swap engine ready at sequence {} for {} -> {}",
               last_sequence_, to_hex(config_.input_asset),
               to_hex(config_.output_asset));
}

swap_result_t engine::swap(const party_id_t& caller,
                           const amount_t& amount_in,
                           const amount_t& minimum_amount_out) {
  auto lock = std::scoped_lock{mutex_};
  return execute(swap_request_t{.input_asset = config_.input_asset,
                                .output_asset = config_.output_asset,
                                .amount_in = amount_in,
                                .minimum_amount_out = minimum_amount_out,
                                .caller = caller});
}

std::optional<amount_t> engine::quote(const amount_t& amount_in) const {
  auto lock = std::scoped_lock{mutex_};
  return venue_.quote(amount_in,
                      make_route(config_.input_asset, config_.output_asset));
}

storage::committed_state engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return storage::committed_state{.sequence = last_sequence_,
                                  .state_root = state_root_};
}

std::vector<swap_receipt_t> engine::history(const uint64_t from_sequence,
                                            const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto receipts = std::vector<swap_receipt_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kHistoryPrefix);
  auto entries =
      storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  for (const auto& [history_key, value] : entries) {
    auto sequence = key::parse_history_key(
        encoder_, bytes_view_t{history_key.data(), history_key.size()});
    if (!sequence) {
      spdlog::warn("Skipping malformed history key {}",
                   to_hex(bytes_view_t{history_key.data(), history_key.size()}));
      continue;
    }
    if (*sequence < from_sequence || *sequence > to_sequence) {
      continue;
    }
    auto receipt = encoder_.try_decode<swap_receipt_t>(
        bytes_view_t{value.data(), value.size()});
    if (!receipt) {
      swapguard::common::critical("failed to decode swap receipt");
    }
    receipts.push_back(std::move(*receipt));
  }
  // Sequences are little-endian in the key, so key order is not sequence order.
  std::sort(receipts.begin(), receipts.end(),
            [](const auto& left, const auto& right) {
              return left.sequence < right.sequence;
            });
  return receipts;
}

swap_result_t engine::execute(const swap_request_t& request) {
  auto sequence = last_sequence_ + 1;
  auto result = swap_result_t{};
  result.codespace = std::string{kCodespace};
  result.sequence = sequence;
  result.request_id = make_request_id(request, sequence);

  auto receipt = swap_receipt_t{
      .sequence = sequence,
      .request_id = result.request_id,
      .caller = request.caller,
      .input_asset = request.input_asset,
      .output_asset = request.output_asset,
      .amount_in = encode_amount(request.amount_in),
      .minimum_amount_out = encode_amount(request.minimum_amount_out),
      .amount_out = encode_amount(amount_t{0}),
      .status = swap_status_t::pending,
      .code = 0,
      .executed_at = clock_()};

  auto failure = std::optional<swap_error_code>{};
  auto outcome = std::optional<settlement_outcome_t>{};
  {
    auto envelope = ledger::ledger_transaction{ledger_};
    if (request.input_asset == request.output_asset) {
      failure = swap_error_code::invalid_amount;
    } else {
      failure = intake_.acquire(request.caller, request.input_asset,
                                request.amount_in);
    }
    if (!failure) {
      std::visit(overloaded{[&](const settlement_outcome_t& value) {
                              outcome = value;
                            },
                            [&](const swap_error_code code) {
                              failure = code;
                            }},
                 executor_.execute(request));
    }

    if (outcome) {
      receipt.status = swap_status_t::settled;
      receipt.amount_out = encode_amount(outcome->amount_out);
    } else {
      receipt.status = swap_status_t::aborted;
      receipt.code = to_code(*failure);
    }

    auto encoded_receipt = encoder_.encode(receipt);
    auto next_root = blake3::fold(
        state_root_,
        bytes_view_t{encoded_receipt.data(), encoded_receipt.size()});
    auto writes = std::vector<storage::staged_write_t>{
        storage::staged_write_t{key::make_history_key(encoder_, sequence),
                                std::move(encoded_receipt)},
        storage::make_committed_state_write(storage::committed_state{
            .sequence = sequence, .state_root = next_root})};

    if (outcome) {
      envelope.commit(writes);
    } else {
      envelope.rollback();
      storage_.write_batch(writes);
    }
    last_sequence_ = sequence;
    state_root_ = next_root;
  }

  result.status = receipt.status;
  if (outcome) {
    result.code = 0;
    result.log = "settled";
    result.outcome = outcome;
    result.events.push_back(
        make_settled_event(request, result.request_id, outcome->amount_out));
    spdlog::info("Swap {} settled: {} in, {} out (minimum {})", sequence,
                 swapguard::schema::to_string(request.amount_in),
                 swapguard::schema::to_string(outcome->amount_out),
                 swapguard::schema::to_string(request.minimum_amount_out));
  } else {
    result.code = to_code(*failure);
    result.log = std::string{swapguard::schema::to_string(*failure)};
    result.info = "no balances were changed";
    result.events.push_back(
        make_aborted_event(request, result.request_id, *failure));
    spdlog::warn("Swap {} aborted: {}", sequence, result.log);
  }
  return result;
}

hash32_t engine::make_request_id(const swap_request_t& request,
                                 const uint64_t sequence) const {
  auto material = encoder_.encode(std::tuple{
      sequence, request.input_asset, request.output_asset,
      encode_amount(request.amount_in),
      encode_amount(request.minimum_amount_out), request.caller});
  return blake3::hash(bytes_view_t{material.data(), material.size()});
}

}  // namespace swapguard::execution
