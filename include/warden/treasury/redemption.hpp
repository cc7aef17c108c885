#pragma once

#include <warden/membership/registry.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/treasury/obligation_aggregator.hpp>

namespace warden::treasury {

inline constexpr auto kMaxRedemptionRate = warden::schema::basis_points_t{10000};

/// Per-unit claim on `pool` shared across `supply` units.
///
/// rate 0 pays nothing, kMaxRedemptionRate pays the plain pro-rata share
/// `pool / supply`, and rates in between pay
/// `base * (rate + (MAX - rate) / supply) / MAX`. Every step floors.
warden::schema::result_t<warden::schema::amount_t> redemption_curve(
    warden::schema::basis_points_t rate,
    const warden::schema::amount_t& supply,
    const warden::schema::amount_t& pool);

class redemption_calculator final {
 public:
  redemption_calculator(warden::runtime::host& host,
                        const obligation_aggregator& obligations,
                        const warden::membership::registry_view& registry,
                        warden::schema::account_id_t treasury);

  /// Native value held by the treasury account.
  warden::schema::amount_t total_treasury() const;

  /// Claim for a single unit at `rate`, after subtracting live obligations.
  warden::schema::result_t<warden::schema::amount_t> calculate_redemption(
      warden::schema::basis_points_t rate) const;

 private:
  warden::runtime::host& host_;
  const obligation_aggregator& obligations_;
  const warden::membership::registry_view& registry_;
  warden::schema::account_id_t treasury_;
};

}  // namespace warden::treasury
