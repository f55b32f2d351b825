#include <swapguard/blake3/hash.hpp>
#include <swapguard/config/options.hpp>

#include <fstream>
#include <stdexcept>

namespace po = boost::program_options;

namespace swapguard::config {

namespace {

std::optional<swapguard::schema::amount_t> get_amount(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  auto parsed = swapguard::schema::try_parse_amount(vm[name].as<std::string>());
  if (!parsed) {
    throw std::invalid_argument{"--" + name +
                                " must be a decimal amount below 2^256"};
  }
  return parsed;
}

std::optional<swapguard::schema::hash32_t> get_id(const po::variables_map& vm,
                                                  const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return parse_id(vm[name].as<std::string>());
}

}  // namespace

swapguard::schema::hash32_t parse_id(const std::string_view value) {
  if (auto hash = swapguard::schema::try_make_hash32(value)) {
    return *hash;
  }
  return swapguard::blake3::hash(value);
}

po::options_description describe() {
  auto description = po::options_description{"swapguard options"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(),
      "deposit|approve|swap|quote|balance|history")(
      "config,c", po::value<std::string>(), "INI file with option defaults")(
      "db", po::value<std::string>()->default_value("swapguard.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>()->default_value("swapguard.log"),
      "log file path")("verbose,v", "Enable debug logging")(
      "executing-party",
      po::value<std::string>()->default_value("swapguard-executor"),
      "party holding custody during a swap (hex id or label)")(
      "venue-party", po::value<std::string>()->default_value("swapguard-venue"),
      "pool party of the exchange venue (hex id or label)")(
      "input-asset", po::value<std::string>()->default_value("asset-in"),
      "asset sold by swap (hex id or label)")(
      "output-asset", po::value<std::string>()->default_value("asset-out"),
      "asset bought by swap (hex id or label)")(
      "fee-ppk", po::value<uint32_t>()->default_value(3),
      "venue fee in parts per thousand")(
      "expiry-tolerance-ms", po::value<uint64_t>()->default_value(0),
      "milliseconds added to the invocation time to form the expiry; the "
      "venue checks against the same reading, so 0 settles")(
      "party", po::value<std::string>(), "acting party (hex id or label)")(
      "asset", po::value<std::string>(), "asset for deposit/balance")(
      "amount", po::value<std::string>(), "decimal amount")(
      "min-out", po::value<std::string>(),
      "minimum acceptable output for swap")(
      "from", po::value<uint64_t>()->default_value(1),
      "first history sequence")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "last history sequence");
  return description;
}

options parse(const int argc, const char* const* argv) {
  auto description = describe();
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    auto path = vm["config"].as<std::string>();
    auto file = std::ifstream{path};
    if (!file) {
      throw std::invalid_argument{"cannot open config file " + path};
    }
    // store() keeps the first value seen, so the command line wins.
    po::store(po::parse_config_file(file, description), vm);
  }
  po::notify(vm);

  auto parsed = options{};
  if (vm.contains("command")) {
    parsed.command = vm["command"].as<std::string>();
  }
  if (vm.contains("help")) {
    parsed.command = "help";
  }
  parsed.db_path = vm["db"].as<std::string>();
  parsed.log_path = vm["log-file"].as<std::string>();
  parsed.verbose = vm.contains("verbose");
  parsed.engine.executing_party =
      parse_id(vm["executing-party"].as<std::string>());
  parsed.engine.input_asset = parse_id(vm["input-asset"].as<std::string>());
  parsed.engine.output_asset = parse_id(vm["output-asset"].as<std::string>());
  parsed.engine.expiry_tolerance_ms = vm["expiry-tolerance-ms"].as<uint64_t>();
  parsed.venue_party = parse_id(vm["venue-party"].as<std::string>());
  parsed.fee_ppk = vm["fee-ppk"].as<uint32_t>();
  if (parsed.fee_ppk >= 1000) {
    throw std::invalid_argument{"--fee-ppk must be below 1000"};
  }
  if (parsed.engine.input_asset == parsed.engine.output_asset) {
    throw std::invalid_argument{"input and output assets must differ"};
  }
  parsed.party = get_id(vm, "party");
  parsed.asset = get_id(vm, "asset");
  parsed.amount = get_amount(vm, "amount");
  parsed.minimum_amount_out = get_amount(vm, "min-out");
  parsed.from_sequence = vm["from"].as<uint64_t>();
  parsed.to_sequence = vm["to"].as<uint64_t>();
  return parsed;
}

}  // namespace swapguard::config
