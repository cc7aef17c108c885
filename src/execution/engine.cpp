#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/execution/engine.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/timelock/fingerprint.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace warden::execution {

namespace {

using bytes_result_t = warden::schema::result_t<warden::schema::bytes_t>;

warden::schema::bytes_t to_data(const warden::schema::hash32_t& hash) {
  return warden::schema::bytes_t{std::begin(hash), std::end(hash)};
}

warden::schema::call_result_t make_error_result(
    const warden::schema::error_t& error,
    const std::string_view codespace) {
  auto result = warden::schema::call_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = error.log;
  result.codespace = std::string{codespace};
  return result;
}

template <typename T>
bytes_result_t forward_error(const warden::schema::result_t<T>& result) {
  return warden::schema::error_of(result);
}

using encoder_t = warden::schema::encoding::scale_encoder_t;
using encoded_action_t = std::tuple<warden::schema::account_id_t,
                                    warden::schema::hash32_t,
                                    std::string,
                                    warden::schema::bytes_t,
                                    uint64_t>;

std::optional<warden::schema::action_t> decode_action(
    const warden::schema::bytes_view_t& arguments) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<encoded_action_t>(arguments);
  if (!decoded) {
    return std::nullopt;
  }
  auto action = warden::schema::action_t{};
  action.target = std::get<0>(*decoded);
  action.value = warden::schema::from_bytes32(std::get<1>(*decoded));
  action.signature = std::move(std::get<2>(*decoded));
  action.data = std::move(std::get<3>(*decoded));
  action.eta = std::get<4>(*decoded);
  return action;
}

warden::schema::error_t undecodable(const std::string_view signature) {
  return warden::schema::make_error(
      warden::schema::error_code::invocation_failed,
      fmt::format("{}: undecodable arguments", signature));
}

}  // namespace

engine::engine(warden::runtime::host& host,
               const warden::membership::registry_view& registry,
               const warden::governance::proposal_source& proposals,
               warden::schema::account_id_t self)
    : host_{host},
      self_{self},
      authority_{host.journal()},
      queued_{host.journal()},
      timelock_{host, authority_, queued_, self},
      obligations_{proposals},
      calculator_{host, obligations_, registry, self},
      facade_{host, authority_, calculator_, registry, self} {
  host_.install(self_, *this);
}

engine::~engine() {
  host_.uninstall(self_);
}

template <typename Operation>
warden::schema::call_result_t engine::run(const std::string_view name,
                                          const std::string_view codespace,
                                          const bool requires_initialized,
                                          Operation&& operation) {
  auto lock = std::scoped_lock{mutex_};
  auto frame = warden::state::scope{host_.journal()};

  if (requires_initialized && !authority_.initialized()) {
    spdlog::warn("{} rejected: engine is not initialized", name);
    return make_error_result(
        warden::schema::make_error(warden::schema::error_code::not_initialized,
                                   fmt::format("{}: not initialized", name)),
        kEngineCodespace);
  }

  auto clock = warden::runtime::clock_frame{host_};
  auto now = clock.now();
  auto outcome = bytes_result_t{operation(now)};
  if (warden::schema::is_error(outcome)) {
    const auto& error = warden::schema::error_of(outcome);
    spdlog::warn("{} rejected with {} ({}): {}", name,
                 warden::schema::to_string(error.code),
                 static_cast<uint32_t>(error.code), error.log);
    return make_error_result(error, codespace);
  }

  auto result = warden::schema::call_result_t{};
  result.data = std::get<warden::schema::bytes_t>(std::move(outcome));
  result.events = frame.commit();
  spdlog::debug("{} committed with {} event(s)", name, result.events.size());
  return result;
}

warden::schema::call_result_t engine::initialize(const genesis_t& genesis) {
  return run("initialize", kEngineCodespace, false,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               if (auto error =
                       authority_.initialize(genesis.admin, genesis.delay)) {
                 return *error;
               }
               if (auto error = facade_.initialize(genesis.redemption_rate)) {
                 return *error;
               }
               spdlog::info("Treasury {} initialized with admin {}, delay {}s, "
                            "redemption rate {}",
                            warden::schema::to_hex(self_),
                            warden::schema::to_hex(genesis.admin),
                            genesis.delay, genesis.redemption_rate);
               return warden::schema::bytes_t{};
             });
}

warden::schema::call_result_t engine::queue_transaction(
    const warden::schema::account_id_t& caller,
    const warden::schema::action_t& action) {
  return run("queueTransaction", kTimelockCodespace, true,
             [&](const warden::schema::timestamp_seconds_t now)
                 -> bytes_result_t {
               auto queued = timelock_.queue_transaction(caller, action, now);
               if (warden::schema::is_error(queued)) {
                 return forward_error(queued);
               }
               return to_data(warden::schema::value_of(queued));
             });
}

warden::schema::call_result_t engine::cancel_transaction(
    const warden::schema::account_id_t& caller,
    const warden::schema::action_t& action) {
  return run("cancelTransaction", kTimelockCodespace, true,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               auto cancelled = timelock_.cancel_transaction(caller, action);
               if (warden::schema::is_error(cancelled)) {
                 return forward_error(cancelled);
               }
               return to_data(warden::schema::value_of(cancelled));
             });
}

warden::schema::call_result_t engine::execute_transaction(
    const warden::schema::account_id_t& caller,
    const warden::schema::action_t& action) {
  return run("executeTransaction", kTimelockCodespace, true,
             [&](const warden::schema::timestamp_seconds_t now) {
               return timelock_.execute_transaction(caller, action, now);
             });
}

warden::schema::call_result_t engine::accept_admin(
    const warden::schema::account_id_t& caller) {
  return run("acceptAdmin", kTimelockCodespace, true,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               if (auto error = authority_.accept_admin(caller)) {
                 return *error;
               }
               return warden::schema::bytes_t{};
             });
}

warden::schema::call_result_t engine::set_redemption_rate(
    const warden::schema::account_id_t& caller,
    const warden::schema::basis_points_t rate) {
  return run("setRedemptionRate", kTreasuryCodespace, true,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               if (auto error = facade_.set_redemption_rate(caller, rate)) {
                 return *error;
               }
               return warden::schema::bytes_t{};
             });
}

warden::schema::call_result_t engine::redeem_for_eth(
    const warden::schema::account_id_t& caller,
    const warden::schema::unit_id_t unit) {
  return run("redeemForETH", kTreasuryCodespace, true,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               auto paid = facade_.redeem_for_eth(caller, unit);
               if (warden::schema::is_error(paid)) {
                 return forward_error(paid);
               }
               return to_data(
                   warden::schema::to_bytes32(warden::schema::value_of(paid)));
             });
}

warden::schema::call_result_t engine::deposit(
    const warden::schema::account_id_t& caller,
    const warden::schema::amount_t& value) {
  return run("deposit", kTreasuryCodespace, false,
             [&](warden::schema::timestamp_seconds_t) -> bytes_result_t {
               if (!host_.invoke(caller, self_, value, {}).success) {
                 return warden::schema::make_error(
                     warden::schema::error_code::insufficient_balance,
                     fmt::format("deposit: {} cannot cover {}",
                                 warden::schema::to_hex(caller),
                                 warden::schema::to_string(value)));
               }
               spdlog::info("Treasury received {} from {}",
                            warden::schema::to_string(value),
                            warden::schema::to_hex(caller));
               return warden::schema::bytes_t{};
             });
}

const warden::schema::account_id_t& engine::address() const {
  return self_;
}

std::optional<warden::schema::account_id_t> engine::admin() const {
  auto lock = std::scoped_lock{mutex_};
  return authority_.admin();
}

std::optional<warden::schema::account_id_t> engine::pending_admin() const {
  auto lock = std::scoped_lock{mutex_};
  return authority_.pending_admin();
}

warden::schema::duration_seconds_t engine::delay() const {
  auto lock = std::scoped_lock{mutex_};
  return authority_.delay();
}

bool engine::is_queued(const warden::schema::fingerprint_t& fingerprint) const {
  auto lock = std::scoped_lock{mutex_};
  return queued_.contains(fingerprint);
}

warden::schema::basis_points_t engine::redemption_rate() const {
  auto lock = std::scoped_lock{mutex_};
  return facade_.redemption_rate();
}

warden::schema::amount_t engine::total_treasury() const {
  auto lock = std::scoped_lock{mutex_};
  return facade_.total_treasury();
}

warden::schema::result_t<warden::schema::amount_t>
engine::allocated_treasury() const {
  auto lock = std::scoped_lock{mutex_};
  return obligations_.allocated_treasury();
}

warden::schema::result_t<warden::schema::amount_t>
engine::calculate_redemption() const {
  auto lock = std::scoped_lock{mutex_};
  return facade_.calculate_redemption();
}

std::vector<warden::schema::event_record_t> engine::events(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return host_.journal().events(from_id, to_id);
}

warden::runtime::call_outcome_t engine::handle(
    const warden::runtime::call_context_t& context,
    const warden::schema::bytes_view_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  if (warden::timelock::engine::is_reserved_call(payload)) {
    spdlog::warn("Rejected {} call from {}: {}",
                 warden::schema::to_string(
                     warden::schema::error_code::caller_not_self),
                 warden::schema::to_hex(context.caller),
                 "self-call functions are only reachable through "
                 "executeTransaction");
    return warden::runtime::call_outcome_t{};
  }

  auto split = warden::timelock::split_payload(payload);
  if (!split) {
    return warden::runtime::call_outcome_t{.success = true, .return_data = {}};
  }
  auto outcome = dispatch(context, split->first, split->second);
  if (warden::schema::is_error(outcome)) {
    const auto& error = warden::schema::error_of(outcome);
    spdlog::warn("Invoke from {} rejected with {}: {}",
                 warden::schema::to_hex(context.caller),
                 warden::schema::to_string(error.code), error.log);
    return warden::runtime::call_outcome_t{};
  }
  return warden::runtime::call_outcome_t{
      .success = true,
      .return_data = std::get<warden::schema::bytes_t>(std::move(outcome))};
}

warden::schema::result_t<warden::schema::bytes_t> engine::dispatch(
    const warden::runtime::call_context_t& context,
    const warden::schema::selector_t& selector,
    const warden::schema::bytes_view_t& arguments) {
  auto encoder = encoder_t{};
  const auto& caller = context.caller;

  if (selector == warden::blake3::selector(kAcceptAdminSignature)) {
    if (auto error = authority_.accept_admin(caller)) {
      return *error;
    }
    return warden::schema::bytes_t{};
  }

  if (selector == warden::blake3::selector(kSetRedemptionRateSignature)) {
    auto decoded = encoder.try_decode<std::tuple<uint32_t>>(arguments);
    if (!decoded) {
      return undecodable(kSetRedemptionRateSignature);
    }
    if (auto error =
            facade_.set_redemption_rate(caller, std::get<0>(*decoded))) {
      return *error;
    }
    return warden::schema::bytes_t{};
  }

  if (selector == warden::blake3::selector(kRedeemForEthSignature)) {
    auto decoded = encoder.try_decode<std::tuple<uint64_t>>(arguments);
    if (!decoded) {
      return undecodable(kRedeemForEthSignature);
    }
    auto paid = facade_.redeem_for_eth(caller, std::get<0>(*decoded));
    if (warden::schema::is_error(paid)) {
      return forward_error(paid);
    }
    return to_data(warden::schema::to_bytes32(warden::schema::value_of(paid)));
  }

  if (selector == warden::blake3::selector(kQueueTransactionSignature)) {
    auto action = decode_action(arguments);
    if (!action) {
      return undecodable(kQueueTransactionSignature);
    }
    auto queued = timelock_.queue_transaction(caller, *action, context.now);
    if (warden::schema::is_error(queued)) {
      return forward_error(queued);
    }
    return to_data(warden::schema::value_of(queued));
  }

  if (selector == warden::blake3::selector(kCancelTransactionSignature)) {
    auto action = decode_action(arguments);
    if (!action) {
      return undecodable(kCancelTransactionSignature);
    }
    auto cancelled = timelock_.cancel_transaction(caller, *action);
    if (warden::schema::is_error(cancelled)) {
      return forward_error(cancelled);
    }
    return to_data(warden::schema::value_of(cancelled));
  }

  if (selector == warden::blake3::selector(kExecuteTransactionSignature)) {
    auto action = decode_action(arguments);
    if (!action) {
      return undecodable(kExecuteTransactionSignature);
    }
    return timelock_.execute_transaction(caller, *action, context.now);
  }

  spdlog::debug("Selector {} from {} handled by fallback",
                warden::schema::to_hex(selector),
                warden::schema::to_hex(caller));
  return warden::schema::bytes_t{};
}

}  // namespace warden::execution
