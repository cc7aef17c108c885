#include <boost/program_options.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/config/options.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <charconv>
#include <limits>
#include <sstream>

namespace po = boost::program_options;

namespace warden::config {

namespace {

uint64_t parse_uint64(const std::string_view text) {
  auto parsed = uint64_t{};
  auto [end, ec] =
      std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    throw po::error{"invalid uint64 argument '" + std::string{text} + "'"};
  }
  return parsed;
}

}  // namespace

options parse_options(const int argc, const char* const argv[]) {
  auto parsed = options{};
  auto now = uint64_t{};
  auto config_file = std::string{};

  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with default option values")(
      "db", po::value<std::string>(&parsed.db_path)->default_value("warden.db"),
      "RocksDB state directory")(
      "log-level",
      po::value<std::string>(&parsed.log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&parsed.log_file),
      "Also write logs to this file")(
      "now", po::value<uint64_t>(&now),
      "Override the clock with a unix timestamp in seconds")(
      "caller", po::value<std::string>(&parsed.caller),
      "Identity performing the operation")(
      "treasury",
      po::value<std::string>(&parsed.treasury)
          ->default_value(std::string{kDefaultTreasury}),
      "Treasury account identity")(
      "registry",
      po::value<std::string>(&parsed.registry)
          ->default_value(std::string{kDefaultRegistry}),
      "Membership registry account identity")(
      "governor",
      po::value<std::string>(&parsed.governor)
          ->default_value(std::string{kDefaultGovernor}),
      "Proposal book account identity");

  auto command = po::options_description{"Command"};
  command.add_options()("admin", po::value<std::string>(&parsed.admin),
                        "init: initial admin identity")(
      "delay", po::value<uint64_t>(&parsed.delay), "init: delay in seconds")(
      "rate", po::value<uint32_t>(&parsed.rate),
      "init, set-rate: redemption rate in basis points")(
      "target", po::value<std::string>(&parsed.target), "Action target")(
      "value", po::value<std::string>(&parsed.value)->default_value("0"),
      "Native value in base units")(
      "signature", po::value<std::string>(&parsed.signature),
      "Function signature, e.g. setDelay(uint64)")(
      "data", po::value<std::string>(&parsed.data), "Call data as hex")(
      "eta", po::value<uint64_t>(&parsed.eta), "Action eta")(
      "arg", po::value<std::vector<std::string>>(&parsed.arguments),
      "encode-call: typed argument, uint64:<n> or bytes32:<identity>")(
      "proposal-target",
      po::value<std::vector<std::string>>(&parsed.targets),
      "propose: target of one proposal action")(
      "proposal-value", po::value<std::vector<std::string>>(&parsed.values),
      "propose: value of one proposal action")(
      "proposal-signature",
      po::value<std::vector<std::string>>(&parsed.signatures),
      "propose: signature of one proposal action")(
      "proposal-data", po::value<std::vector<std::string>>(&parsed.datas),
      "propose: hex data of one proposal action")(
      "proposal", po::value<uint64_t>(&parsed.proposal),
      "set-proposal-state: proposal index")(
      "state", po::value<std::string>(&parsed.state),
      "set-proposal-state: pending, active, canceled, defeated, succeeded, "
      "queued, expired or executed")(
      "account", po::value<std::string>(&parsed.account),
      "faucet, mint: receiving identity")(
      "unit", po::value<uint64_t>(&parsed.unit), "redeem: membership unit")(
      "from", po::value<uint64_t>(&parsed.from)->default_value(0),
      "events: first event id")(
      "to",
      po::value<uint64_t>(&parsed.to)
          ->default_value(std::numeric_limits<uint64_t>::max()),
      "events: last event id");

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>(&parsed.command));

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto all = po::options_description{};
  all.add(general).add(command).add(hidden);
  auto visible = po::options_description{
      "Usage: warden <init|status|faucet|deposit|mint|propose|"
      "set-proposal-state|fingerprint|encode-call|queue|cancel|execute|"
      "accept-admin|set-rate|redeem|events> [options]"};
  visible.add(general).add(command);

  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file(
                  vm["config"].as<std::string>().c_str(), all),
              vm);
  }
  po::notify(vm);

  auto usage = std::ostringstream{};
  usage << visible;
  parsed.usage = usage.str();
  parsed.help = vm.contains("help");
  if (vm.contains("now")) {
    parsed.now = now;
  }
  if (!parsed.help && parsed.command.empty()) {
    throw po::error{"no command given"};
  }
  return parsed;
}

warden::schema::account_id_t resolve_account(const std::string_view identity) {
  if (identity.size() == 64) {
    if (auto hash = warden::schema::try_make_hash32(identity)) {
      return *hash;
    }
  }
  return warden::blake3::hash(identity);
}

warden::schema::bytes_t encode_typed_arguments(
    const std::vector<std::string>& arguments) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  auto encoded = warden::schema::bytes_t{};
  for (const auto& argument : arguments) {
    auto separator = argument.find(':');
    if (separator == std::string::npos) {
      throw po::error{"argument '" + argument + "' has no type prefix"};
    }
    auto type = std::string_view{argument}.substr(0, separator);
    auto value = std::string_view{argument}.substr(separator + 1);
    if (type == "uint64") {
      encoder.append(parse_uint64(value), encoded);
    } else if (type == "bytes32") {
      encoder.append(resolve_account(value), encoded);
    } else {
      throw po::error{"unsupported argument type '" + std::string{type} + "'"};
    }
  }
  return encoded;
}

}  // namespace warden::config
