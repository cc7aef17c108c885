#pragma once

#include <warden/membership/registry.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/timelock/admin_authority.hpp>
#include <warden/treasury/redemption.hpp>
#include <optional>

namespace warden::treasury {

/// Redemption entry points and the redemption rate they are priced at.
class facade final {
 public:
  facade(warden::runtime::host& host,
         const warden::timelock::admin_authority& authority,
         const redemption_calculator& calculator,
         const warden::membership::registry_view& registry,
         warden::schema::account_id_t treasury);

  warden::schema::basis_points_t redemption_rate() const;
  warden::schema::amount_t total_treasury() const;
  warden::schema::result_t<warden::schema::amount_t> calculate_redemption()
      const;

  /// Write the initial rate without an admin check.
  std::optional<warden::schema::error_t> initialize(
      warden::schema::basis_points_t rate);

  std::optional<warden::schema::error_t> set_redemption_rate(
      const warden::schema::account_id_t& caller,
      warden::schema::basis_points_t rate);

  /// Burn `unit` and pay its owner the current per-unit claim. The claim is
  /// computed once, before the burn changes the supply.
  warden::schema::result_t<warden::schema::amount_t> redeem_for_eth(
      const warden::schema::account_id_t& caller,
      warden::schema::unit_id_t unit);

 private:
  void write_rate(warden::schema::basis_points_t rate);

  warden::runtime::host& host_;
  const warden::timelock::admin_authority& authority_;
  const redemption_calculator& calculator_;
  const warden::membership::registry_view& registry_;
  warden::schema::account_id_t treasury_;
};

}  // namespace warden::treasury
