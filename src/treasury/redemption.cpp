#include <spdlog/fmt/fmt.h>
#include <warden/treasury/arithmetic.hpp>
#include <warden/treasury/redemption.hpp>

namespace warden::treasury {

warden::schema::result_t<warden::schema::amount_t> redemption_curve(
    const warden::schema::basis_points_t rate,
    const warden::schema::amount_t& supply,
    const warden::schema::amount_t& pool) {
  if (rate == 0) {
    return warden::schema::amount_t{};
  }
  if (rate > kMaxRedemptionRate) {
    return warden::schema::make_error(
        warden::schema::error_code::redemption_rate_above_maximum,
        fmt::format("redemption rate {} exceeds {}", rate, kMaxRedemptionRate));
  }

  auto base = mul_div(pool, 1, supply);
  if (warden::schema::is_error(base) || rate == kMaxRedemptionRate) {
    return base;
  }

  auto bonus = mul_div(1, kMaxRedemptionRate - rate, supply);
  if (warden::schema::is_error(bonus)) {
    return bonus;
  }
  auto scale = checked_add(rate, warden::schema::value_of(bonus));
  if (warden::schema::is_error(scale)) {
    return scale;
  }
  return mul_div(warden::schema::value_of(base),
                 warden::schema::value_of(scale), kMaxRedemptionRate);
}

redemption_calculator::redemption_calculator(
    warden::runtime::host& host,
    const obligation_aggregator& obligations,
    const warden::membership::registry_view& registry,
    warden::schema::account_id_t treasury)
    : host_{host},
      obligations_{obligations},
      registry_{registry},
      treasury_{treasury} {}

warden::schema::amount_t redemption_calculator::total_treasury() const {
  return host_.balance_of(treasury_);
}

warden::schema::result_t<warden::schema::amount_t>
redemption_calculator::calculate_redemption(
    const warden::schema::basis_points_t rate) const {
  auto allocated = obligations_.allocated_treasury();
  if (warden::schema::is_error(allocated)) {
    return allocated;
  }
  auto pool = checked_sub(total_treasury(), warden::schema::value_of(allocated));
  if (warden::schema::is_error(pool)) {
    return warden::schema::make_error(
        warden::schema::error_code::arithmetic_underflow,
        fmt::format("calculateRedemption: allocated {} exceeds treasury {}",
                    warden::schema::to_string(warden::schema::value_of(allocated)),
                    warden::schema::to_string(total_treasury())));
  }
  return redemption_curve(rate, registry_.total_supply(),
                          warden::schema::value_of(pool));
}

}  // namespace warden::treasury
