#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <warden/treasury/arithmetic.hpp>
#include <warden/treasury/obligation_aggregator.hpp>

namespace warden::treasury {

obligation_aggregator::obligation_aggregator(
    const warden::governance::proposal_source& proposals)
    : proposals_{proposals} {}

warden::schema::result_t<warden::schema::amount_t>
obligation_aggregator::allocated_treasury() const {
  auto allocated = warden::schema::amount_t{};
  auto count = proposals_.proposal_count();
  for (auto index = uint64_t{}; index < count; ++index) {
    auto state = proposals_.state(index);
    if (!state) {
      return warden::schema::make_error(
          warden::schema::error_code::proposal_missing,
          fmt::format("allocatedTreasury: proposal {} has no state", index));
    }
    if (!warden::schema::is_live(*state)) {
      continue;
    }
    auto actions = proposals_.get_actions(index);
    if (!actions) {
      return warden::schema::make_error(
          warden::schema::error_code::proposal_missing,
          fmt::format("allocatedTreasury: proposal {} has no actions", index));
    }
    if (actions->values.empty()) {
      continue;
    }
    // The final value of each proposal is not counted.
    for (auto i = std::size_t{}; i + 1 < actions->values.size(); ++i) {
      auto sum = checked_add(allocated, actions->values[i]);
      if (warden::schema::is_error(sum)) {
        return warden::schema::error_of(sum);
      }
      allocated = warden::schema::value_of(sum);
    }
  }
  spdlog::debug("Allocated treasury across {} proposals: {}", count,
                warden::schema::to_string(allocated));
  return allocated;
}

}  // namespace warden::treasury
