#pragma once

#include <warden/governance/proposal_source.hpp>
#include <warden/membership/registry.hpp>
#include <warden/runtime/contract.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/call_result.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/event.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/timelock/admin_authority.hpp>
#include <warden/timelock/engine.hpp>
#include <warden/timelock/queued_set.hpp>
#include <warden/treasury/facade.hpp>
#include <warden/treasury/obligation_aggregator.hpp>
#include <warden/treasury/redemption.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::execution {

inline constexpr auto kTimelockCodespace = std::string_view{"warden.timelock"};
inline constexpr auto kTreasuryCodespace = std::string_view{"warden.treasury"};
inline constexpr auto kEngineCodespace = std::string_view{"warden.engine"};

// Entry points reachable by invoking the treasury account. Action arguments
// are (target, value as bytes32, signature, data, eta).
inline constexpr auto kQueueTransactionSignature =
    std::string_view{"queueTransaction(bytes32,bytes32,string,bytes,uint64)"};
inline constexpr auto kCancelTransactionSignature =
    std::string_view{"cancelTransaction(bytes32,bytes32,string,bytes,uint64)"};
inline constexpr auto kExecuteTransactionSignature = std::string_view{
    "executeTransaction(bytes32,bytes32,string,bytes,uint64)"};
inline constexpr auto kAcceptAdminSignature = std::string_view{"acceptAdmin()"};
inline constexpr auto kSetRedemptionRateSignature =
    std::string_view{"setRedemptionRate(uint32)"};
inline constexpr auto kRedeemForEthSignature =
    std::string_view{"redeemForETH(uint64)"};

/// Construction parameters of the treasury account.
struct genesis_t final {
  warden::schema::account_id_t admin{};
  warden::schema::duration_seconds_t delay{};
  warden::schema::basis_points_t redemption_rate{};
};

/// Timelocked treasury living at one account of the host.
///
/// Every entry point runs as one atomic operation: it either commits all of
/// its state changes and events, or returns a non-zero code and leaves state
/// untouched. The clock is read once per entry point.
class engine final : public warden::runtime::contract {
 public:
  /// Wire the components over `host` and install the engine as the code of
  /// `self`. The registry and proposal source must outlive the engine.
  engine(warden::runtime::host& host,
         const warden::membership::registry_view& registry,
         const warden::governance::proposal_source& proposals,
         warden::schema::account_id_t self);
  ~engine() override;

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Validate and persist genesis parameters. Succeeds once per state
  /// directory.
  warden::schema::call_result_t initialize(const genesis_t& genesis);

  /// Queue an action. `data` of the result carries its fingerprint.
  warden::schema::call_result_t queue_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action);

  warden::schema::call_result_t cancel_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action);

  /// Execute a matured action. `data` carries the target's return data.
  warden::schema::call_result_t execute_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action);

  warden::schema::call_result_t accept_admin(
      const warden::schema::account_id_t& caller);

  warden::schema::call_result_t set_redemption_rate(
      const warden::schema::account_id_t& caller,
      warden::schema::basis_points_t rate);

  /// Redeem a membership unit. `data` carries the paid value as 32 bytes
  /// big-endian.
  warden::schema::call_result_t redeem_for_eth(
      const warden::schema::account_id_t& caller,
      warden::schema::unit_id_t unit);

  /// Send native value to the treasury through its receive entry point.
  warden::schema::call_result_t deposit(
      const warden::schema::account_id_t& caller,
      const warden::schema::amount_t& value);

  const warden::schema::account_id_t& address() const;
  std::optional<warden::schema::account_id_t> admin() const;
  std::optional<warden::schema::account_id_t> pending_admin() const;
  warden::schema::duration_seconds_t delay() const;
  bool is_queued(const warden::schema::fingerprint_t& fingerprint) const;
  warden::schema::basis_points_t redemption_rate() const;
  warden::schema::amount_t total_treasury() const;
  warden::schema::result_t<warden::schema::amount_t> allocated_treasury()
      const;
  warden::schema::result_t<warden::schema::amount_t> calculate_redemption()
      const;

  /// Return persisted events in the inclusive id range.
  std::vector<warden::schema::event_record_t> events(uint64_t from_id,
                                                     uint64_t to_id) const;

  /// Entry point for calls arriving through the host. Known selectors run
  /// the matching operation as `context.caller`; an empty payload or an
  /// unknown selector is accepted by the receive and fallback entry points.
  warden::runtime::call_outcome_t handle(
      const warden::runtime::call_context_t& context,
      const warden::schema::bytes_view_t& payload) override;

 private:
  template <typename Operation>
  warden::schema::call_result_t run(std::string_view name,
                                    std::string_view codespace,
                                    bool requires_initialized,
                                    Operation&& operation);

  warden::schema::result_t<warden::schema::bytes_t> dispatch(
      const warden::runtime::call_context_t& context,
      const warden::schema::selector_t& selector,
      const warden::schema::bytes_view_t& arguments);

  mutable std::recursive_mutex mutex_;
  warden::runtime::host& host_;
  warden::schema::account_id_t self_;
  warden::timelock::admin_authority authority_;
  warden::timelock::queued_set queued_;
  warden::timelock::engine timelock_;
  warden::treasury::obligation_aggregator obligations_;
  warden::treasury::redemption_calculator calculator_;
  warden::treasury::facade facade_;
};

}  // namespace warden::execution
