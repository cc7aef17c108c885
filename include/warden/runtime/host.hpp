#pragma once

#include <warden/runtime/contract.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/state/journal.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace warden::runtime {

inline constexpr auto kMaxCallDepth = std::size_t{64};

/// Execution platform for the treasury: native value ledger, code registry,
/// clock, and the atomic invoke-with-value primitive.
class host final {
 public:
  host(warden::state::journal& journal, clock_source_t clock);

  host(const host&) = delete;
  host& operator=(const host&) = delete;

  /// The pinned reading while a clock_frame is open, else the clock.
  warden::schema::timestamp_seconds_t now() const;
  warden::state::journal& journal();
  const warden::state::journal& journal() const;

  warden::schema::amount_t balance_of(
      const warden::schema::account_id_t& account) const;

  /// Credit newly issued native value to an account.
  void deposit(const warden::schema::account_id_t& to,
               const warden::schema::amount_t& value);

  /// Move native value inside the current journal frame. Returns false and
  /// stages nothing when `from` cannot cover `value`.
  bool transfer(const warden::schema::account_id_t& from,
                const warden::schema::account_id_t& to,
                const warden::schema::amount_t& value);

  /// Transfer `value` from caller to target and run the target's code, if
  /// any, with `payload`. Runs in its own journal frame: on failure every
  /// effect of the call, the value transfer included, is reverted.
  call_outcome_t invoke(const warden::schema::account_id_t& caller,
                        const warden::schema::account_id_t& target,
                        const warden::schema::amount_t& value,
                        const warden::schema::bytes_view_t& payload);

  void install(const warden::schema::account_id_t& address, contract& code);
  void uninstall(const warden::schema::account_id_t& address);
  bool has_code(const warden::schema::account_id_t& address) const;

 private:
  friend class clock_frame;

  void write_balance(const warden::schema::account_id_t& account,
                     const warden::schema::amount_t& value);

  warden::state::journal& journal_;
  clock_source_t clock_;
  std::map<warden::schema::account_id_t, contract*> contracts_;
  std::size_t depth_{};
  std::optional<warden::schema::timestamp_seconds_t> pinned_now_;
};

/// Reads the clock once and serves that reading to every nested invoke until
/// destroyed. Frames opened while one is active reuse the outer reading.
class clock_frame final {
 public:
  explicit clock_frame(host& host);
  ~clock_frame();

  clock_frame(const clock_frame&) = delete;
  clock_frame& operator=(const clock_frame&) = delete;

  warden::schema::timestamp_seconds_t now() const;

 private:
  host& host_;
  bool owner_{};
};

}  // namespace warden::runtime
