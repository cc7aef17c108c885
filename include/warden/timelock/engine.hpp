#pragma once

#include <warden/runtime/contract.hpp>
#include <warden/runtime/host.hpp>
#include <warden/schema/action.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/timelock/admin_authority.hpp>
#include <warden/timelock/queued_set.hpp>

namespace warden::timelock {

inline constexpr auto kGracePeriod = 14 * kSecondsPerDay;

/// Queue/cancel/execute state machine keyed by action fingerprint.
///
/// Unqueued -> Queued -> {Executed | Cancelled}. Callers run each operation
/// inside a journal scope; a returned error means that scope must be
/// reverted, which also restores the queued flag cleared by a failed execute.
class engine final {
 public:
  engine(warden::runtime::host& host,
         admin_authority& authority,
         queued_set& queued,
         warden::schema::account_id_t self);

  /// Requires `eta >= now + delay` with the delay in effect now.
  warden::schema::result_t<warden::schema::fingerprint_t> queue_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action,
      warden::schema::timestamp_seconds_t now);

  /// Clears the queued flag whether or not it was set.
  warden::schema::result_t<warden::schema::fingerprint_t> cancel_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action);

  /// Requires the action queued and `eta <= now <= eta + kGracePeriod`.
  /// Returns the target's raw return data.
  warden::schema::result_t<warden::schema::bytes_t> execute_transaction(
      const warden::schema::account_id_t& caller,
      const warden::schema::action_t& action,
      warden::schema::timestamp_seconds_t now);

  /// True for payloads selecting a function only the execute path may reach.
  static bool is_reserved_call(const warden::schema::bytes_view_t& payload);

 private:
  /// Runs setDelay or setPendingAdmin for an action targeting the system.
  warden::runtime::call_outcome_t dispatch_self_call(
      const warden::schema::amount_t& value,
      const warden::schema::bytes_view_t& payload);

  void emit(std::string_view type,
            const warden::schema::fingerprint_t& fingerprint,
            const warden::schema::action_t& action);

  warden::runtime::host& host_;
  admin_authority& authority_;
  queued_set& queued_;
  warden::schema::account_id_t self_;
};

}  // namespace warden::timelock
