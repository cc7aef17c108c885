#pragma once

#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::config {

inline constexpr auto kDefaultTreasury = std::string_view{"warden.treasury"};
inline constexpr auto kDefaultRegistry = std::string_view{"warden.registry"};
inline constexpr auto kDefaultGovernor = std::string_view{"warden.governor"};

/// Parsed command line for the `warden` tool. Identities are given either as
/// 64 hex characters or as a label, which is hashed into an account id.
struct options final {
  bool help{};
  std::string usage;
  std::string command;

  std::string db_path{"warden.db"};
  std::string log_level{"info"};
  std::string log_file;
  std::optional<uint64_t> now;

  std::string caller;
  std::string treasury{kDefaultTreasury};
  std::string registry{kDefaultRegistry};
  std::string governor{kDefaultGovernor};

  // init
  std::string admin;
  uint64_t delay{};
  uint32_t rate{};

  // actions
  std::string target;
  std::string value{"0"};
  std::string signature;
  std::string data;
  uint64_t eta{};
  std::vector<std::string> arguments;

  // proposals
  std::vector<std::string> targets;
  std::vector<std::string> values;
  std::vector<std::string> signatures;
  std::vector<std::string> datas;
  uint64_t proposal{};
  std::string state;

  std::string account;
  uint64_t unit{};
  uint64_t from{};
  uint64_t to{};
};

/// Parse the command line, then the config file named by `--config` if any.
/// Values on the command line win over the config file. Throws
/// `boost::program_options::error` on malformed input.
options parse_options(int argc, const char* const argv[]);

/// Account id for a hex string or a label.
warden::schema::account_id_t resolve_account(std::string_view identity);

/// SCALE argument bytes for `type:value` tokens (`uint64:<n>`,
/// `bytes32:<identity>`).
warden::schema::bytes_t encode_typed_arguments(
    const std::vector<std::string>& arguments);

}  // namespace warden::config
