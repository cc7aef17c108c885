#pragma once

#include <warden/governance/proposal_source.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/state/journal.hpp>

namespace warden::governance {

/// Journal-backed proposal source. Proposals are indexed from zero in
/// submission order and start out `pending`.
class proposal_book final : public proposal_source {
 public:
  proposal_book(warden::state::journal& journal,
                warden::schema::account_id_t address);

  uint64_t proposal_count() const override;
  std::optional<warden::schema::proposal_state_t> state(
      uint64_t index) const override;
  std::optional<warden::schema::proposal_actions_t> get_actions(
      uint64_t index) const override;

  warden::schema::result_t<uint64_t> propose(
      const warden::schema::proposal_actions_t& actions);

  std::optional<warden::schema::error_t> set_state(
      uint64_t index,
      warden::schema::proposal_state_t state);

  const warden::schema::account_id_t& address() const;

 private:
  warden::state::journal& journal_;
  warden::schema::account_id_t address_;
};

}  // namespace warden::governance
