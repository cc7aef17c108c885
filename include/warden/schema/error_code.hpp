#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace warden::schema {

enum class error_code : uint32_t {
  ok = 0,
  caller_not_admin = 10,
  caller_not_pending_admin = 11,
  caller_not_self = 12,
  caller_not_unit_owner = 13,
  caller_not_minter = 14,
  delay_below_minimum = 20,
  delay_above_maximum = 21,
  redemption_rate_above_maximum = 22,
  eta_below_delay = 30,
  transaction_not_queued = 31,
  transaction_not_matured = 32,
  transaction_stale = 33,
  not_initialized = 34,
  already_initialized = 35,
  proposal_missing = 36,
  proposal_malformed = 37,
  unit_missing = 38,
  insufficient_balance = 39,
  invocation_failed = 40,
  burn_failed = 41,
  value_transfer_failed = 42,
  division_by_zero = 50,
  arithmetic_overflow = 51,
  arithmetic_underflow = 52,
};

template <>
struct enum_names<error_code> final {
  static constexpr auto table = std::array{
      enum_mapping_t<error_code>{"ok", error_code::ok},
      enum_mapping_t<error_code>{"caller_not_admin", error_code::caller_not_admin},
      enum_mapping_t<error_code>{"caller_not_pending_admin", error_code::caller_not_pending_admin},
      enum_mapping_t<error_code>{"caller_not_self", error_code::caller_not_self},
      enum_mapping_t<error_code>{"caller_not_unit_owner", error_code::caller_not_unit_owner},
      enum_mapping_t<error_code>{"caller_not_minter", error_code::caller_not_minter},
      enum_mapping_t<error_code>{"delay_below_minimum", error_code::delay_below_minimum},
      enum_mapping_t<error_code>{"delay_above_maximum", error_code::delay_above_maximum},
      enum_mapping_t<error_code>{"redemption_rate_above_maximum", error_code::redemption_rate_above_maximum},
      enum_mapping_t<error_code>{"eta_below_delay", error_code::eta_below_delay},
      enum_mapping_t<error_code>{"transaction_not_queued", error_code::transaction_not_queued},
      enum_mapping_t<error_code>{"transaction_not_matured", error_code::transaction_not_matured},
      enum_mapping_t<error_code>{"transaction_stale", error_code::transaction_stale},
      enum_mapping_t<error_code>{"not_initialized", error_code::not_initialized},
      enum_mapping_t<error_code>{"already_initialized", error_code::already_initialized},
      enum_mapping_t<error_code>{"proposal_missing", error_code::proposal_missing},
      enum_mapping_t<error_code>{"proposal_malformed", error_code::proposal_malformed},
      enum_mapping_t<error_code>{"unit_missing", error_code::unit_missing},
      enum_mapping_t<error_code>{"insufficient_balance", error_code::insufficient_balance},
      enum_mapping_t<error_code>{"invocation_failed", error_code::invocation_failed},
      enum_mapping_t<error_code>{"burn_failed", error_code::burn_failed},
      enum_mapping_t<error_code>{"value_transfer_failed", error_code::value_transfer_failed},
      enum_mapping_t<error_code>{"division_by_zero", error_code::division_by_zero},
      enum_mapping_t<error_code>{"arithmetic_overflow", error_code::arithmetic_overflow},
      enum_mapping_t<error_code>{"arithmetic_underflow", error_code::arithmetic_underflow}};
};

inline constexpr std::string_view to_string(const error_code value) {
  return name_of(value).value_or("unknown");
}

enum class error_category : uint8_t {
  none = 0,
  authorization = 1,
  bounds = 2,
  precondition = 3,
  external_call = 4,
  arithmetic = 5
};

/// Codes are allocated in blocks of ten per category.
constexpr error_category category_of(const error_code code) {
  switch (static_cast<uint32_t>(code) / 10) {
    case 1:
      return error_category::authorization;
    case 2:
      return error_category::bounds;
    case 3:
      return error_category::precondition;
    case 4:
      return error_category::external_call;
    case 5:
      return error_category::arithmetic;
    default:
      return error_category::none;
  }
}

template <>
struct enum_names<error_category> final {
  static constexpr auto table = std::array{
      enum_mapping_t<error_category>{"none", error_category::none},
      enum_mapping_t<error_category>{"authorization",
                                     error_category::authorization},
      enum_mapping_t<error_category>{"bounds", error_category::bounds},
      enum_mapping_t<error_category>{"precondition",
                                     error_category::precondition},
      enum_mapping_t<error_category>{"external_call",
                                     error_category::external_call},
      enum_mapping_t<error_category>{"arithmetic", error_category::arithmetic}};
};

inline constexpr std::string_view to_string(const error_category value) {
  return name_of(value).value_or("unknown");
}

/// Failure reported by a component. The operation that produced it is rolled
/// back in full by the caller's journal scope.
struct error_t final {
  error_code code{error_code::ok};
  std::string log;
};

template <typename T>
using result_t = std::variant<T, error_t>;

template <typename T>
bool is_error(const result_t<T>& result) {
  return std::holds_alternative<error_t>(result);
}

template <typename T>
const error_t& error_of(const result_t<T>& result) {
  return std::get<error_t>(result);
}

template <typename T>
const T& value_of(const result_t<T>& result) {
  return std::get<T>(result);
}

inline error_t make_error(const error_code code, std::string log) {
  return error_t{.code = code, .log = std::move(log)};
}

}  // namespace warden::schema
