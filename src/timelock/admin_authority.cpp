#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/schema/event.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/timelock/admin_authority.hpp>
#include <string>

namespace warden::timelock {

namespace {

warden::schema::bytes_t key_of(const std::string_view key) {
  return warden::schema::key::make_key(key);
}

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

std::optional<warden::schema::error_t> validate_delay(
    const warden::schema::duration_seconds_t delay) {
  if (delay < kMinimumDelay) {
    return warden::schema::make_error(
        warden::schema::error_code::delay_below_minimum,
        fmt::format("delay {}s is below the minimum of {}s", delay,
                    kMinimumDelay));
  }
  if (delay > kMaximumDelay) {
    return warden::schema::make_error(
        warden::schema::error_code::delay_above_maximum,
        fmt::format("delay {}s exceeds the maximum of {}s", delay,
                    kMaximumDelay));
  }
  return std::nullopt;
}

admin_authority::admin_authority(warden::state::journal& journal)
    : journal_{journal} {}

std::optional<warden::schema::error_t> admin_authority::initialize(
    const warden::schema::account_id_t& admin,
    const warden::schema::duration_seconds_t delay) {
  if (initialized()) {
    return warden::schema::make_error(
        warden::schema::error_code::already_initialized,
        "admin_authority::initialize: admin already set");
  }
  if (warden::schema::is_zero(admin)) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_admin,
        "admin_authority::initialize: admin must be non-zero");
  }
  if (auto error = validate_delay(delay)) {
    return error;
  }
  journal_.write(view(key_of(warden::schema::key::kAdminKey)), admin);
  journal_.write(view(key_of(warden::schema::key::kDelayKey)), delay);
  return std::nullopt;
}

bool admin_authority::initialized() const {
  return admin().has_value();
}

std::optional<warden::schema::account_id_t> admin_authority::admin() const {
  return journal_.read<warden::schema::account_id_t>(
      view(key_of(warden::schema::key::kAdminKey)));
}

std::optional<warden::schema::account_id_t> admin_authority::pending_admin()
    const {
  auto pending = journal_.read<warden::schema::account_id_t>(
      view(key_of(warden::schema::key::kPendingAdminKey)));
  if (!pending || warden::schema::is_zero(*pending)) {
    return std::nullopt;
  }
  return pending;
}

warden::schema::duration_seconds_t admin_authority::delay() const {
  return journal_
      .read<warden::schema::duration_seconds_t>(
          view(key_of(warden::schema::key::kDelayKey)))
      .value_or(0);
}

std::optional<warden::schema::error_t> admin_authority::require_admin(
    const warden::schema::account_id_t& caller,
    const std::string_view operation) const {
  auto current = admin();
  if (!current || *current != caller) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_admin,
        fmt::format("{}: call must come from admin", operation));
  }
  return std::nullopt;
}

std::optional<warden::schema::error_t> admin_authority::set_delay(
    const self_call_token&,
    const warden::schema::duration_seconds_t delay) {
  if (auto error = validate_delay(delay)) {
    return error;
  }
  journal_.write(view(key_of(warden::schema::key::kDelayKey)), delay);
  journal_.emit(warden::schema::event_t{
      .type = std::string{warden::schema::kNewDelayEvent},
      .attributes = {{.key = "delay", .value = std::to_string(delay)}}});
  spdlog::info("Timelock delay set to {}s", delay);
  return std::nullopt;
}

void admin_authority::set_pending_admin(
    const self_call_token&,
    const warden::schema::account_id_t& candidate) {
  journal_.write(view(key_of(warden::schema::key::kPendingAdminKey)),
                 candidate);
  journal_.emit(warden::schema::event_t{
      .type = std::string{warden::schema::kNewPendingAdminEvent},
      .attributes = {{.key = "pending_admin",
                      .value = warden::schema::to_hex(candidate),
                      .index = true}}});
  spdlog::info("Pending admin set to {}", warden::schema::to_hex(candidate));
}

std::optional<warden::schema::error_t> admin_authority::accept_admin(
    const warden::schema::account_id_t& caller) {
  auto pending = pending_admin();
  if (!pending || *pending != caller) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_pending_admin,
        "acceptAdmin: call must come from pending admin");
  }
  journal_.write(view(key_of(warden::schema::key::kAdminKey)), caller);
  journal_.write(view(key_of(warden::schema::key::kPendingAdminKey)),
                 warden::schema::make_zero_hash());
  journal_.emit(warden::schema::event_t{
      .type = std::string{warden::schema::kNewAdminEvent},
      .attributes = {{.key = "admin",
                      .value = warden::schema::to_hex(caller),
                      .index = true}}});
  spdlog::info("Admin role accepted by {}", warden::schema::to_hex(caller));
  return std::nullopt;
}

}  // namespace warden::timelock
