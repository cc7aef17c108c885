#pragma once

#include <warden/schema/primitives.hpp>
#include <functional>

namespace warden::runtime {

/// Source of the current time in seconds. Read once per top-level operation
/// through runtime::clock_frame.
using clock_source_t = std::function<warden::schema::timestamp_seconds_t()>;

/// Context handed to code running at an account during an invoke.
struct call_context_t final {
  warden::schema::account_id_t caller{};
  warden::schema::account_id_t self{};
  warden::schema::amount_t value{};
  warden::schema::timestamp_seconds_t now{};
};

/// Outcome of the invoke primitive.
struct call_outcome_t final {
  bool success{};
  warden::schema::bytes_t return_data;
};

/// Code installed at an account. Handlers may reenter the host; the host
/// reverts everything they staged when they report failure.
class contract {
 public:
  virtual ~contract() = default;

  virtual call_outcome_t handle(const call_context_t& context,
                                const warden::schema::bytes_view_t& payload) = 0;
};

}  // namespace warden::runtime
