#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/schema/event.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/timelock/fingerprint.hpp>
#include <warden/treasury/facade.hpp>
#include <string>

namespace warden::treasury {

namespace {

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

std::optional<warden::schema::error_t> validate_rate(
    const warden::schema::basis_points_t rate) {
  if (rate > kMaxRedemptionRate) {
    return warden::schema::make_error(
        warden::schema::error_code::redemption_rate_above_maximum,
        fmt::format("setRedemptionRate: rate {} exceeds {}", rate,
                    kMaxRedemptionRate));
  }
  return std::nullopt;
}

}  // namespace

facade::facade(warden::runtime::host& host,
               const warden::timelock::admin_authority& authority,
               const redemption_calculator& calculator,
               const warden::membership::registry_view& registry,
               warden::schema::account_id_t treasury)
    : host_{host},
      authority_{authority},
      calculator_{calculator},
      registry_{registry},
      treasury_{treasury} {}

warden::schema::basis_points_t facade::redemption_rate() const {
  auto key = warden::schema::key::make_key(
      warden::schema::key::kRedemptionRateKey);
  return host_.journal()
      .read<warden::schema::basis_points_t>(view(key))
      .value_or(0);
}

warden::schema::amount_t facade::total_treasury() const {
  return calculator_.total_treasury();
}

warden::schema::result_t<warden::schema::amount_t>
facade::calculate_redemption() const {
  return calculator_.calculate_redemption(redemption_rate());
}

std::optional<warden::schema::error_t> facade::initialize(
    const warden::schema::basis_points_t rate) {
  if (auto error = validate_rate(rate)) {
    return error;
  }
  write_rate(rate);
  return std::nullopt;
}

std::optional<warden::schema::error_t> facade::set_redemption_rate(
    const warden::schema::account_id_t& caller,
    const warden::schema::basis_points_t rate) {
  if (auto error = authority_.require_admin(caller, "setRedemptionRate")) {
    return error;
  }
  if (auto error = validate_rate(rate)) {
    return error;
  }
  auto previous = redemption_rate();
  write_rate(rate);
  host_.journal().emit(warden::schema::event_t{
      .type = std::string{warden::schema::kNewRedemptionRateEvent},
      .attributes = {{.key = "previous_rate",
                      .value = std::to_string(previous)},
                     {.key = "rate", .value = std::to_string(rate)}}});
  spdlog::info("Redemption rate changed from {} to {}", previous, rate);
  return std::nullopt;
}

warden::schema::result_t<warden::schema::amount_t> facade::redeem_for_eth(
    const warden::schema::account_id_t& caller,
    const warden::schema::unit_id_t unit) {
  auto owner = registry_.owner_of(unit);
  if (!owner) {
    return warden::schema::make_error(
        warden::schema::error_code::unit_missing,
        fmt::format("redeemForETH: unit {} does not exist", unit));
  }
  if (*owner != caller) {
    return warden::schema::make_error(
        warden::schema::error_code::caller_not_unit_owner,
        fmt::format("redeemForETH: caller does not own unit {}", unit));
  }

  auto claim = calculate_redemption();
  if (warden::schema::is_error(claim)) {
    return claim;
  }
  const auto& value = warden::schema::value_of(claim);

  auto burn = warden::timelock::encode_call(warden::membership::kBurnSignature,
                                            unit);
  if (!host_.invoke(treasury_, registry_.address(), 0, view(burn)).success) {
    return warden::schema::make_error(
        warden::schema::error_code::burn_failed,
        fmt::format("redeemForETH: registry refused to burn unit {}", unit));
  }

  auto payout = host_.invoke(treasury_, caller, value, {});
  if (!payout.success) {
    return warden::schema::make_error(
        warden::schema::error_code::value_transfer_failed,
        fmt::format("redeemForETH: transfer of {} failed",
                    warden::schema::to_string(value)));
  }

  host_.journal().emit(warden::schema::event_t{
      .type = std::string{warden::schema::kRedemptionEvent},
      .attributes = {{.key = "redeemer",
                      .value = warden::schema::to_hex(caller),
                      .index = true},
                     {.key = "unit", .value = std::to_string(unit)},
                     {.key = "value",
                      .value = warden::schema::to_string(value)}}});
  spdlog::info("Unit {} redeemed for {}", unit,
               warden::schema::to_string(value));
  return value;
}

void facade::write_rate(const warden::schema::basis_points_t rate) {
  auto key = warden::schema::key::make_key(
      warden::schema::key::kRedemptionRateKey);
  host_.journal().write(view(key), rate);
}

}  // namespace warden::treasury
