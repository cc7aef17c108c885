#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/proposal_actions.hpp>
#include <warden/schema/proposal_state.hpp>
#include <cstdint>
#include <optional>

namespace warden::governance {

/// Read side of the governance contract that owns obligations.
class proposal_source {
 public:
  virtual ~proposal_source() = default;

  virtual uint64_t proposal_count() const = 0;
  virtual std::optional<warden::schema::proposal_state_t> state(
      uint64_t index) const = 0;
  virtual std::optional<warden::schema::proposal_actions_t> get_actions(
      uint64_t index) const = 0;
};

}  // namespace warden::governance
