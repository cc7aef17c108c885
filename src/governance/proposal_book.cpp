#include <spdlog/spdlog.h>
#include <warden/governance/proposal_book.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <vector>

namespace warden::governance {

namespace {

using stored_proposal_t = std::tuple<uint8_t,
                                     std::vector<warden::schema::account_id_t>,
                                     std::vector<warden::schema::hash32_t>,
                                     std::vector<std::string>,
                                     std::vector<warden::schema::bytes_t>>;

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

bool is_known_state(const uint8_t raw) {
  return raw <= static_cast<uint8_t>(warden::schema::proposal_state_t::executed);
}

}  // namespace

proposal_book::proposal_book(warden::state::journal& journal,
                             warden::schema::account_id_t address)
    : journal_{journal}, address_{address} {}

uint64_t proposal_book::proposal_count() const {
  return journal_
      .read<uint64_t>(
          view(warden::schema::key::make_proposal_count_key(address_)))
      .value_or(0);
}

std::optional<warden::schema::proposal_state_t> proposal_book::state(
    const uint64_t index) const {
  auto stored = journal_.read<stored_proposal_t>(
      view(warden::schema::key::make_proposal_key(address_, index)));
  if (!stored || !is_known_state(std::get<0>(*stored))) {
    return std::nullopt;
  }
  return static_cast<warden::schema::proposal_state_t>(std::get<0>(*stored));
}

std::optional<warden::schema::proposal_actions_t> proposal_book::get_actions(
    const uint64_t index) const {
  auto stored = journal_.read<stored_proposal_t>(
      view(warden::schema::key::make_proposal_key(address_, index)));
  if (!stored) {
    return std::nullopt;
  }
  auto actions = warden::schema::proposal_actions_t{};
  actions.targets = std::get<1>(*stored);
  actions.values.reserve(std::get<2>(*stored).size());
  for (const auto& value : std::get<2>(*stored)) {
    actions.values.push_back(warden::schema::from_bytes32(value));
  }
  actions.signatures = std::get<3>(*stored);
  actions.datas = std::get<4>(*stored);
  return actions;
}

warden::schema::result_t<uint64_t> proposal_book::propose(
    const warden::schema::proposal_actions_t& actions) {
  auto size = actions.targets.size();
  if (actions.values.size() != size || actions.signatures.size() != size ||
      actions.datas.size() != size) {
    return warden::schema::make_error(
        warden::schema::error_code::proposal_malformed,
        "proposal_book::propose: action arrays differ in length");
  }

  auto values = std::vector<warden::schema::hash32_t>{};
  values.reserve(size);
  for (const auto& value : actions.values) {
    values.push_back(warden::schema::to_bytes32(value));
  }

  auto frame = warden::state::scope{journal_};
  auto index = proposal_count();
  journal_.write(
      view(warden::schema::key::make_proposal_key(address_, index)),
      stored_proposal_t{
          static_cast<uint8_t>(warden::schema::proposal_state_t::pending),
          actions.targets, values, actions.signatures, actions.datas});
  journal_.write(view(warden::schema::key::make_proposal_count_key(address_)),
                 index + 1);
  frame.commit();

  spdlog::info("Recorded proposal {} with {} action(s)", index, size);
  return index;
}

std::optional<warden::schema::error_t> proposal_book::set_state(
    const uint64_t index,
    const warden::schema::proposal_state_t state) {
  auto key = warden::schema::key::make_proposal_key(address_, index);
  auto stored = journal_.read<stored_proposal_t>(view(key));
  if (!stored) {
    return warden::schema::make_error(
        warden::schema::error_code::proposal_missing,
        "proposal_book::set_state: unknown proposal");
  }
  std::get<0>(*stored) = static_cast<uint8_t>(state);

  auto frame = warden::state::scope{journal_};
  journal_.write(view(key), *stored);
  frame.commit();

  spdlog::info("Proposal {} moved to {}", index,
               warden::schema::to_string(state));
  return std::nullopt;
}

const warden::schema::account_id_t& proposal_book::address() const {
  return address_;
}

}  // namespace warden::governance
