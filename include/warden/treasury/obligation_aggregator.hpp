#pragma once

#include <warden/governance/proposal_source.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::treasury {

/// Value earmarked by live governance proposals. Never stored; recomputed on
/// every call from the proposal source.
class obligation_aggregator final {
 public:
  explicit obligation_aggregator(
      const warden::governance::proposal_source& proposals);

  /// Sum over pending, active and queued proposals of every value in the
  /// proposal's action list except the last one.
  warden::schema::result_t<warden::schema::amount_t> allocated_treasury() const;

 private:
  const warden::governance::proposal_source& proposals_;
};

}  // namespace warden::treasury
