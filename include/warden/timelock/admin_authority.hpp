#pragma once

#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/state/journal.hpp>
#include <warden/timelock/self_call.hpp>
#include <optional>
#include <string_view>

namespace warden::timelock {

inline constexpr auto kSecondsPerDay = warden::schema::duration_seconds_t{86400};
inline constexpr auto kMinimumDelay = 2 * kSecondsPerDay;
inline constexpr auto kMaximumDelay = 30 * kSecondsPerDay;

/// Reject delays outside [kMinimumDelay, kMaximumDelay].
std::optional<warden::schema::error_t> validate_delay(
    warden::schema::duration_seconds_t delay);

/// Admin identity, pending admin and delay.
///
/// Delay and pending-admin changes require a `self_call_token`, so they only
/// happen through an executed timelock action. The admin role itself moves
/// only when the pending admin claims it.
class admin_authority final {
 public:
  explicit admin_authority(warden::state::journal& journal);

  /// Write the initial admin and delay. Fails if already initialized.
  std::optional<warden::schema::error_t> initialize(
      const warden::schema::account_id_t& admin,
      warden::schema::duration_seconds_t delay);

  bool initialized() const;
  std::optional<warden::schema::account_id_t> admin() const;
  /// Empty when no pending admin is set (stored as the zero identity).
  std::optional<warden::schema::account_id_t> pending_admin() const;
  warden::schema::duration_seconds_t delay() const;

  std::optional<warden::schema::error_t> require_admin(
      const warden::schema::account_id_t& caller,
      std::string_view operation) const;

  std::optional<warden::schema::error_t> set_delay(
      const self_call_token& token,
      warden::schema::duration_seconds_t delay);

  void set_pending_admin(const self_call_token& token,
                         const warden::schema::account_id_t& candidate);

  std::optional<warden::schema::error_t> accept_admin(
      const warden::schema::account_id_t& caller);

 private:
  warden::state::journal& journal_;
};

}  // namespace warden::timelock
