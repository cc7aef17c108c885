#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/state/journal.hpp>

namespace warden::timelock {

/// Fingerprint -> queued flag. Absent entries read as not queued, so an action
/// that was never queued and one that already ran are indistinguishable.
class queued_set final {
 public:
  explicit queued_set(warden::state::journal& journal);

  bool contains(const warden::schema::fingerprint_t& fingerprint) const;
  void set(const warden::schema::fingerprint_t& fingerprint, bool queued);

 private:
  warden::state::journal& journal_;
};

}  // namespace warden::timelock
