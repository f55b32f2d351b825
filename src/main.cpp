#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <swapguard/common/critical.hpp>
#include <swapguard/config/options.hpp>
#include <swapguard/exchange/constant_product_venue.hpp>
#include <swapguard/execution/engine.hpp>
#include <swapguard/ledger/state_ledger.hpp>
#include <swapguard/storage/rocksdb/storage.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using encoder_t = swapguard::schema::encoding::encoder<
    swapguard::schema::encoding::scale_encoder_tag>;

void print_help() {
  std::cout << "Usage:\n"
            << "  swapguard deposit --party P --amount N [--asset A]\n"
            << "  swapguard approve --party P --amount N\n"
            << "  swapguard swap --party P --amount N --min-out M\n"
            << "  swapguard quote --amount N\n"
            << "  swapguard balance --party P [--asset A]\n"
            << "  swapguard history [--from S] [--to S]\n\n";
  std::cout << swapguard::config::describe() << '\n';
}

void install_logger(const swapguard::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_path, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "swapguard", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

const swapguard::schema::party_id_t& require_party(
    const swapguard::config::options& options) {
  if (!options.party) {
    swapguard::common::critical("command requires --party");
  }
  return *options.party;
}

const swapguard::schema::amount_t& require_amount(
    const swapguard::config::options& options) {
  if (!options.amount) {
    swapguard::common::critical("command requires --amount");
  }
  return *options.amount;
}

void print_balance(swapguard::ledger::state_ledger& ledger,
                   const swapguard::schema::party_id_t& party,
                   const swapguard::schema::asset_id_t& asset) {
  std::cout << swapguard::schema::to_hex(asset) << ' '
            << swapguard::schema::to_string(ledger.balance_of(party, asset))
            << '\n';
}

void print_result(const swapguard::schema::swap_result_t& result) {
  std::cout << "sequence: " << result.sequence << '\n'
            << "request_id: " << swapguard::schema::to_hex(result.request_id)
            << '\n'
            << "status: " << swapguard::schema::to_string(result.status) << '\n'
            << "code: " << result.code << '\n'
            << "log: " << result.log << '\n';
  if (result.outcome) {
    std::cout << "amount_out: "
              << swapguard::schema::to_string(result.outcome->amount_out)
              << '\n';
  }
}

int run(const swapguard::config::options& options) {
  auto encoder = encoder_t{};
  auto storage =
      swapguard::storage::make_storage<swapguard::storage::rocksdb_storage_tag>(
          options.db_path);
  auto ledger = swapguard::ledger::state_ledger{encoder, storage};
  // One reading per invocation so the expiry and the venue check agree.
  auto clock = swapguard::exchange::fixed_clock_source(
      swapguard::exchange::system_clock_source()());
  auto venue = swapguard::exchange::constant_product_venue{
      ledger, options.venue_party, clock, options.fee_ppk};
  venue.list_pair(options.engine.input_asset, options.engine.output_asset);
  auto engine = swapguard::execution::engine{encoder, storage, ledger,
                                             venue,   options.engine, clock};

  const auto& command = options.command;
  if (command == "deposit") {
    const auto& party = require_party(options);
    auto asset = options.asset.value_or(options.engine.input_asset);
    auto status = ledger.credit(party, asset, require_amount(options));
    if (status != swapguard::ledger::ledger_status::ok) {
      spdlog::error("deposit failed: {}",
                    swapguard::ledger::to_string(status));
      return 1;
    }
    print_balance(ledger, party, asset);
    return 0;
  }
  if (command == "approve") {
    const auto& party = require_party(options);
    auto status = ledger.authorize(party, options.engine.executing_party,
                                   options.engine.input_asset,
                                   require_amount(options));
    if (status != swapguard::ledger::ledger_status::ok) {
      spdlog::error("approve failed: {}",
                    swapguard::ledger::to_string(status));
      return 1;
    }
    std::cout << swapguard::schema::to_string(ledger.allowance(
                     party, options.engine.executing_party,
                     options.engine.input_asset))
              << '\n';
    return 0;
  }
  if (command == "swap") {
    if (!options.minimum_amount_out) {
      swapguard::common::critical("swap requires --min-out");
    }
    auto result = engine.swap(require_party(options), require_amount(options),
                              *options.minimum_amount_out);
    print_result(result);
    return result.code == 0 ? 0 : 2;
  }
  if (command == "quote") {
    auto quoted = engine.quote(require_amount(options));
    if (!quoted) {
      spdlog::error("route unavailable");
      return 1;
    }
    std::cout << swapguard::schema::to_string(*quoted) << '\n';
    return 0;
  }
  if (command == "balance") {
    const auto& party = require_party(options);
    if (options.asset) {
      print_balance(ledger, party, *options.asset);
    } else {
      print_balance(ledger, party, options.engine.input_asset);
      print_balance(ledger, party, options.engine.output_asset);
    }
    return 0;
  }
  if (command == "history") {
    auto info = engine.info();
    std::cout << "sequence: " << info.sequence << '\n'
              << "state_root: " << swapguard::schema::to_hex(info.state_root)
              << '\n';
    for (const auto& receipt :
         engine.history(options.from_sequence, options.to_sequence)) {
      std::cout << receipt.sequence << ' '
                << swapguard::schema::to_hex(receipt.request_id) << ' '
                << swapguard::schema::to_string(receipt.status) << ' '
                << receipt.code << ' '
                << swapguard::schema::to_string(
                       swapguard::schema::decode_amount(receipt.amount_in))
                << ' '
                << swapguard::schema::to_string(
                       swapguard::schema::decode_amount(receipt.amount_out))
                << '\n';
    }
    return 0;
  }
  swapguard::common::critical("unsupported command");
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = swapguard::config::options{};
  try {
    options = swapguard::config::parse(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "swapguard: " << e.what() << '\n';
    return 1;
  }

  if (options.command == "help" || options.command.empty()) {
    print_help();
    return 0;
  }

  install_logger(options);
  auto rc = run(options);
  spdlog::shutdown();
  return rc;
}
