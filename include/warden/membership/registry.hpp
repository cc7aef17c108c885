#pragma once

#include <warden/runtime/contract.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace warden::membership {

inline constexpr auto kBurnSignature = std::string_view{"burn(uint64)"};
inline constexpr auto kMintSignature = std::string_view{"mint(bytes32)"};

/// Read side of a membership registry as seen by the treasury.
class registry_view {
 public:
  virtual ~registry_view() = default;

  virtual const warden::schema::account_id_t& address() const = 0;
  virtual uint64_t total_supply() const = 0;
  virtual std::optional<warden::schema::account_id_t> owner_of(
      warden::schema::unit_id_t unit) const = 0;
};

/// Redeemable membership units. Units are minted by the minter and burned by
/// their owner or the configured burner (the treasury). Reachable through the
/// host as code at `address` with `mint(bytes32)` and `burn(uint64)`.
class registry final : public registry_view, public warden::runtime::contract {
 public:
  registry(warden::runtime::host& host, warden::schema::account_id_t address);
  ~registry() override;

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// Record minter and burner identities. Later calls replace them.
  void configure(const warden::schema::account_id_t& minter,
                 const warden::schema::account_id_t& burner);

  const warden::schema::account_id_t& address() const override;
  uint64_t total_supply() const override;
  std::optional<warden::schema::account_id_t> owner_of(
      warden::schema::unit_id_t unit) const override;

  warden::schema::result_t<warden::schema::unit_id_t> mint(
      const warden::schema::account_id_t& caller,
      const warden::schema::account_id_t& to);

  std::optional<warden::schema::error_t> burn(
      const warden::schema::account_id_t& caller,
      warden::schema::unit_id_t unit);

  warden::runtime::call_outcome_t handle(
      const warden::runtime::call_context_t& context,
      const warden::schema::bytes_view_t& payload) override;

 private:
  std::optional<std::pair<warden::schema::account_id_t,
                          warden::schema::account_id_t>>
  roles() const;

  warden::runtime::host& host_;
  warden::schema::account_id_t address_;
};

}  // namespace warden::membership
