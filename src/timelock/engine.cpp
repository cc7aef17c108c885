#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/blake3/hash.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/event.hpp>
#include <warden/timelock/engine.hpp>
#include <warden/timelock/fingerprint.hpp>
#include <string>
#include <tuple>
#include <utility>

namespace warden::timelock {

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;

warden::runtime::call_outcome_t failed_call() {
  return warden::runtime::call_outcome_t{};
}

warden::runtime::call_outcome_t accepted_call() {
  return warden::runtime::call_outcome_t{.success = true, .return_data = {}};
}

}  // namespace

engine::engine(warden::runtime::host& host,
               admin_authority& authority,
               queued_set& queued,
               warden::schema::account_id_t self)
    : host_{host}, authority_{authority}, queued_{queued}, self_{self} {}

warden::schema::result_t<warden::schema::fingerprint_t>
engine::queue_transaction(const warden::schema::account_id_t& caller,
                          const warden::schema::action_t& action,
                          const warden::schema::timestamp_seconds_t now) {
  if (auto error = authority_.require_admin(caller, "queueTransaction")) {
    return *error;
  }
  auto delay = authority_.delay();
  if (action.eta < now + delay) {
    return warden::schema::make_error(
        warden::schema::error_code::eta_below_delay,
        fmt::format("queueTransaction: eta {} must be at least {} (now {} + "
                    "delay {})",
                    action.eta, now + delay, now, delay));
  }

  auto fingerprint = make_fingerprint(action);
  queued_.set(fingerprint, true);
  emit(warden::schema::kQueueTransactionEvent, fingerprint, action);
  spdlog::info("Queued action {} for eta {}",
               warden::schema::to_hex(fingerprint), action.eta);
  return fingerprint;
}

warden::schema::result_t<warden::schema::fingerprint_t>
engine::cancel_transaction(const warden::schema::account_id_t& caller,
                           const warden::schema::action_t& action) {
  if (auto error = authority_.require_admin(caller, "cancelTransaction")) {
    return *error;
  }
  auto fingerprint = make_fingerprint(action);
  queued_.set(fingerprint, false);
  emit(warden::schema::kCancelTransactionEvent, fingerprint, action);
  spdlog::info("Cancelled action {}", warden::schema::to_hex(fingerprint));
  return fingerprint;
}

warden::schema::result_t<warden::schema::bytes_t> engine::execute_transaction(
    const warden::schema::account_id_t& caller,
    const warden::schema::action_t& action,
    const warden::schema::timestamp_seconds_t now) {
  if (auto error = authority_.require_admin(caller, "executeTransaction")) {
    return *error;
  }

  auto fingerprint = make_fingerprint(action);
  if (!queued_.contains(fingerprint)) {
    return warden::schema::make_error(
        warden::schema::error_code::transaction_not_queued,
        "executeTransaction: transaction hasn't been queued");
  }
  if (now < action.eta) {
    return warden::schema::make_error(
        warden::schema::error_code::transaction_not_matured,
        fmt::format("executeTransaction: transaction hasn't surpassed time "
                    "lock (now {}, eta {})",
                    now, action.eta));
  }
  if (now - action.eta > kGracePeriod) {
    return warden::schema::make_error(
        warden::schema::error_code::transaction_stale,
        fmt::format("executeTransaction: transaction is stale (now {}, eta {})",
                    now, action.eta));
  }

  // Cleared before the call so a reentrant execute of the same action fails.
  queued_.set(fingerprint, false);

  auto payload = make_call_payload(action);
  auto payload_view = warden::schema::bytes_view_t{payload.data(), payload.size()};
  // Other calls into the system run through its own handler with the system
  // as caller, so they pass or fail that entry point's authorization.
  auto outcome = action.target == self_ && is_reserved_call(payload_view)
                     ? dispatch_self_call(action.value, payload_view)
                     : host_.invoke(self_, action.target, action.value,
                                    payload_view);
  if (!outcome.success) {
    return warden::schema::make_error(
        warden::schema::error_code::invocation_failed,
        "executeTransaction: transaction execution reverted");
  }

  emit(warden::schema::kExecuteTransactionEvent, fingerprint, action);
  spdlog::info("Executed action {} against {}",
               warden::schema::to_hex(fingerprint),
               warden::schema::to_hex(action.target));
  return std::move(outcome.return_data);
}

bool engine::is_reserved_call(const warden::schema::bytes_view_t& payload) {
  auto split = split_payload(payload);
  if (!split) {
    return false;
  }
  return split->first == warden::blake3::selector(kSetDelaySignature) ||
         split->first == warden::blake3::selector(kSetPendingAdminSignature);
}

warden::runtime::call_outcome_t engine::dispatch_self_call(
    const warden::schema::amount_t& value,
    const warden::schema::bytes_view_t& payload) {
  if (host_.balance_of(self_) < value) {
    spdlog::warn("Self-call needs {} but the treasury holds {}",
                 warden::schema::to_string(value),
                 warden::schema::to_string(host_.balance_of(self_)));
    return failed_call();
  }

  auto split = split_payload(payload);
  if (!split) {
    return failed_call();
  }

  auto frame = warden::state::scope{host_.journal()};
  auto encoder = encoder_t{};
  auto token = self_call_token{};
  const auto& [selector, arguments] = *split;

  if (selector == warden::blake3::selector(kSetDelaySignature)) {
    auto decoded = encoder.try_decode<std::tuple<uint64_t>>(arguments);
    if (!decoded) {
      spdlog::warn("setDelay self-call carried undecodable arguments");
      return failed_call();
    }
    if (auto error = authority_.set_delay(token, std::get<0>(*decoded))) {
      spdlog::warn("setDelay self-call rejected: {}", error->log);
      return failed_call();
    }
  } else {
    auto decoded =
        encoder.try_decode<std::tuple<warden::schema::account_id_t>>(arguments);
    if (!decoded) {
      spdlog::warn("setPendingAdmin self-call carried undecodable arguments");
      return failed_call();
    }
    authority_.set_pending_admin(token, std::get<0>(*decoded));
  }

  frame.commit();
  return accepted_call();
}

void engine::emit(const std::string_view type,
                  const warden::schema::fingerprint_t& fingerprint,
                  const warden::schema::action_t& action) {
  host_.journal().emit(warden::schema::event_t{
      .type = std::string{type},
      .attributes = {
          {.key = "fingerprint",
           .value = warden::schema::to_hex(fingerprint),
           .index = true},
          {.key = "target",
           .value = warden::schema::to_hex(action.target),
           .index = true},
          {.key = "value", .value = warden::schema::to_string(action.value)},
          {.key = "signature", .value = action.signature},
          {.key = "data", .value = warden::schema::to_hex(action.data)},
          {.key = "eta", .value = std::to_string(action.eta)}}});
}

}  // namespace warden::timelock
