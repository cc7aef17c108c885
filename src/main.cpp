#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/config/options.hpp>
#include <warden/execution/engine.hpp>
#include <warden/governance/proposal_book.hpp>
#include <warden/membership/registry.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/proposal_state.hpp>
#include <warden/state/journal.hpp>
#include <warden/timelock/fingerprint.hpp>
#include <chrono>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

using command_t = std::function<int()>;

void configure_logging(const warden::config::options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(options.log_level));
}

warden::runtime::clock_source_t make_clock(
    const warden::config::options& options) {
  if (options.now) {
    return [now = *options.now] { return now; };
  }
  return [] {
    return static_cast<warden::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

warden::schema::amount_t parse_amount(const std::string& text) {
  auto amount = warden::schema::try_parse_amount(text);
  if (!amount) {
    throw boost::program_options::error{"invalid amount '" + text + "'"};
  }
  return *amount;
}

warden::schema::bytes_t parse_data(const std::string& hex) {
  auto bytes = warden::schema::try_from_hex(hex);
  if (!bytes) {
    throw boost::program_options::error{"invalid hex data '" + hex + "'"};
  }
  return *bytes;
}

warden::schema::action_t make_action(const warden::config::options& options) {
  auto action = warden::schema::action_t{};
  action.target = warden::config::resolve_account(options.target);
  action.value = parse_amount(options.value);
  action.signature = options.signature;
  action.data = parse_data(options.data);
  action.eta = options.eta;
  return action;
}

int report(const warden::schema::call_result_t& result) {
  if (!result.ok()) {
    std::cout << "error " << result.code << " ("
              << warden::schema::to_string(result.error()) << ", "
              << result.codespace << "): " << result.log << std::endl;
    return 1;
  }
  if (!result.data.empty()) {
    std::cout << warden::schema::to_hex(result.data) << std::endl;
  }
  for (const auto& event : result.events) {
    std::cout << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << std::endl;
  }
  return 0;
}

int report(const warden::schema::error_t& error) {
  std::cout << "error " << static_cast<uint32_t>(error.code) << " ("
            << warden::schema::to_string(error.code) << "): " << error.log
            << std::endl;
  return 1;
}

std::string describe(
    const warden::schema::result_t<warden::schema::amount_t>& amount) {
  if (warden::schema::is_error(amount)) {
    return std::string{"error: "} + warden::schema::error_of(amount).log;
  }
  return warden::schema::to_string(warden::schema::value_of(amount));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = warden::config::options{};
  try {
    options = warden::config::parse_options(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl;
    return 2;
  }
  if (options.help) {
    std::cout << options.usage << std::endl;
    return 0;
  }

  configure_logging(options);

  auto storage = warden::storage::make_storage<
      warden::storage::rocksdb_storage_tag>(options.db_path);
  auto journal = warden::state::journal{storage};
  auto host = warden::runtime::host{journal, make_clock(options)};

  auto caller = warden::config::resolve_account(options.caller);
  auto treasury_id = warden::config::resolve_account(options.treasury);
  auto registry = warden::membership::registry{
      host, warden::config::resolve_account(options.registry)};
  auto proposals = warden::governance::proposal_book{
      journal, warden::config::resolve_account(options.governor)};
  auto engine =
      warden::execution::engine{host, registry, proposals, treasury_id};

  auto commands = std::map<std::string, command_t>{
      {"init",
       [&] {
         auto result = engine.initialize(warden::execution::genesis_t{
             .admin = warden::config::resolve_account(options.admin),
             .delay = options.delay,
             .redemption_rate = options.rate});
         if (result.ok()) {
           registry.configure(caller, treasury_id);
         }
         return report(result);
       }},
      {"status",
       [&] {
         auto admin = engine.admin();
         auto pending = engine.pending_admin();
         std::cout << "treasury            " << warden::schema::to_hex(treasury_id)
                   << "\nadmin               "
                   << (admin ? warden::schema::to_hex(*admin) : "-")
                   << "\npending admin       "
                   << (pending ? warden::schema::to_hex(*pending) : "-")
                   << "\ndelay               " << engine.delay()
                   << "\nredemption rate     " << engine.redemption_rate()
                   << "\ntotal treasury      "
                   << warden::schema::to_string(engine.total_treasury())
                   << "\nallocated treasury  "
                   << describe(engine.allocated_treasury())
                   << "\nredemption per unit "
                   << describe(engine.calculate_redemption())
                   << "\nmembership supply   " << registry.total_supply()
                   << "\nproposals           " << proposals.proposal_count()
                   << std::endl;
         return 0;
       }},
      {"faucet",
       [&] {
         auto account = warden::config::resolve_account(options.account);
         host.deposit(account, parse_amount(options.value));
         std::cout << warden::schema::to_string(host.balance_of(account))
                   << std::endl;
         return 0;
       }},
      {"deposit",
       [&] { return report(engine.deposit(caller, parse_amount(options.value))); }},
      {"mint",
       [&] {
         auto minted = registry.mint(
             caller, warden::config::resolve_account(options.account));
         if (warden::schema::is_error(minted)) {
           return report(warden::schema::error_of(minted));
         }
         std::cout << warden::schema::value_of(minted) << std::endl;
         return 0;
       }},
      {"propose",
       [&] {
         auto actions = warden::schema::proposal_actions_t{};
         for (const auto& target : options.targets) {
           actions.targets.push_back(warden::config::resolve_account(target));
         }
         for (const auto& value : options.values) {
           actions.values.push_back(parse_amount(value));
         }
         actions.signatures = options.signatures;
         for (const auto& data : options.datas) {
           actions.datas.push_back(parse_data(data));
         }
         auto index = proposals.propose(actions);
         if (warden::schema::is_error(index)) {
           return report(warden::schema::error_of(index));
         }
         std::cout << warden::schema::value_of(index) << std::endl;
         return 0;
       }},
      {"set-proposal-state",
       [&] {
         auto state = warden::schema::try_from_string<
             warden::schema::proposal_state_t>(options.state);
         if (!state) {
           throw boost::program_options::error{"unknown proposal state '" +
                                               options.state + "'"};
         }
         if (auto error = proposals.set_state(options.proposal, *state)) {
           return report(*error);
         }
         return 0;
       }},
      {"fingerprint",
       [&] {
         std::cout << warden::schema::to_hex(
                          warden::timelock::make_fingerprint(make_action(options)))
                   << std::endl;
         return 0;
       }},
      {"encode-call",
       [&] {
         std::cout << warden::schema::to_hex(
                          warden::config::encode_typed_arguments(options.arguments))
                   << std::endl;
         return 0;
       }},
      {"queue",
       [&] { return report(engine.queue_transaction(caller, make_action(options))); }},
      {"cancel",
       [&] { return report(engine.cancel_transaction(caller, make_action(options))); }},
      {"execute",
       [&] { return report(engine.execute_transaction(caller, make_action(options))); }},
      {"accept-admin", [&] { return report(engine.accept_admin(caller)); }},
      {"set-rate",
       [&] { return report(engine.set_redemption_rate(caller, options.rate)); }},
      {"redeem",
       [&] { return report(engine.redeem_for_eth(caller, options.unit)); }},
      {"events", [&] {
         for (const auto& record : engine.events(options.from, options.to)) {
           std::cout << record.event_id << " #" << record.sequence << " "
                     << record.event.type;
           for (const auto& attribute : record.event.attributes) {
             std::cout << " " << attribute.key << "=" << attribute.value;
           }
           std::cout << std::endl;
         }
         return 0;
       }}};

  auto status = 0;
  auto command = commands.find(options.command);
  if (command == std::end(commands)) {
    std::cerr << "unknown command '" << options.command << "'\n"
              << options.usage << std::endl;
    status = 2;
  } else {
    try {
      status = command->second();
    } catch (const boost::program_options::error& e) {
      std::cerr << e.what() << std::endl;
      status = 2;
    }
  }

  spdlog::shutdown();
  return status;
}
