#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: proposal state.
// Treasury workflow: lifecycle of an external governance proposal. Pending,
// active and queued proposals still earmark treasury value.
namespace warden::schema {

enum class proposal_state_t : uint8_t {
  pending = 0,
  active = 1,
  canceled = 2,
  defeated = 3,
  succeeded = 4,
  queued = 5,
  expired = 6,
  executed = 7
};

template <>
struct enum_names<proposal_state_t> final {
  static constexpr auto table = std::array{
      enum_mapping_t<proposal_state_t>{"pending", proposal_state_t::pending},
      enum_mapping_t<proposal_state_t>{"active", proposal_state_t::active},
      enum_mapping_t<proposal_state_t>{"canceled", proposal_state_t::canceled},
      enum_mapping_t<proposal_state_t>{"defeated", proposal_state_t::defeated},
      enum_mapping_t<proposal_state_t>{"succeeded",
                                       proposal_state_t::succeeded},
      enum_mapping_t<proposal_state_t>{"queued", proposal_state_t::queued},
      enum_mapping_t<proposal_state_t>{"expired", proposal_state_t::expired},
      enum_mapping_t<proposal_state_t>{"executed", proposal_state_t::executed}};
};

inline constexpr std::string_view to_string(const proposal_state_t value) {
  return name_of(value).value_or("unknown");
}

constexpr bool is_live(const proposal_state_t value) {
  return value == proposal_state_t::pending ||
         value == proposal_state_t::active || value == proposal_state_t::queued;
}

}  // namespace warden::schema
