#pragma once

#include <swapguard/execution/engine_config.hpp>
#include <swapguard/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace swapguard::config {

/// Settings for one `swapguard` command-line run.
struct options final {
  std::string command;
  std::string db_path{"swapguard.db"};
  std::string log_path{"swapguard.log"};
  bool verbose{false};
  swapguard::execution::engine_config engine;
  swapguard::schema::party_id_t venue_party{};
  uint32_t fee_ppk{3};
  std::optional<swapguard::schema::party_id_t> party;
  std::optional<swapguard::schema::asset_id_t> asset;
  std::optional<swapguard::schema::amount_t> amount;
  std::optional<swapguard::schema::amount_t> minimum_amount_out;
  uint64_t from_sequence{1};
  uint64_t to_sequence{UINT64_MAX};
};

/// Interpret `value` as a 32-byte hex id, or hash it with BLAKE3 as a label.
swapguard::schema::hash32_t parse_id(std::string_view value);

/// Describe every option accepted on the command line and in config files.
boost::program_options::options_description describe();

/// Parse the command line, then the INI file named by `--config` if any.
/// Command-line values take precedence over file values.
///
/// Throws boost::program_options::error on malformed input and
/// std::invalid_argument on values that fail validation.
options parse(int argc, const char* const* argv);

}  // namespace swapguard::config
