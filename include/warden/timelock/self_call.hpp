#pragma once

#include <string_view>

namespace warden::timelock {

class engine;

inline constexpr auto kSetDelaySignature = std::string_view{"setDelay(uint64)"};
inline constexpr auto kSetPendingAdminSignature =
    std::string_view{"setPendingAdmin(bytes32)"};

/// Capability proving a call reached the system through a queued and matured
/// action that targets the system itself. Only the timelock engine can mint
/// one.
class self_call_token final {
 private:
  self_call_token() = default;
  friend class engine;
};

}  // namespace warden::timelock
