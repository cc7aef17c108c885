#include <gtest/gtest.h>
#include <warden/testing/contracts.hpp>
#include <warden/testing/execution_fixture.hpp>

#include <vector>

namespace {

using warden::schema::amount_t;
using warden::schema::error_code;
using warden::testing::execution_fixture;
using warden::testing::make_account;

const auto kHolder = make_account(0x51);

/// Fund the treasury and mint `supply` units, the first one to kHolder and
/// the rest to a bystander.
warden::schema::unit_id_t seed_members(execution_fixture& fixture,
                                       const amount_t& pool,
                                       const uint64_t supply) {
  fixture.fund_treasury(pool);
  auto first = fixture.mint_to(kHolder);
  for (auto i = uint64_t{1}; i < supply; ++i) {
    fixture.mint_to(make_account(0x52));
  }
  return first;
}

amount_t redemption_of(execution_fixture& fixture) {
  auto result = fixture.engine().calculate_redemption();
  EXPECT_FALSE(warden::schema::is_error(result))
      << warden::schema::error_of(result).log;
  return warden::schema::is_error(result) ? amount_t{}
                                          : warden::schema::value_of(result);
}

}  // namespace

TEST(redemption_integration, redeem_pays_worked_example_and_burns_unit) {
  auto fixture = execution_fixture{"warden_redeem_worked"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  auto unit = seed_members(fixture, 1'000'000, 100);
  EXPECT_EQ(redemption_of(fixture), 5050);

  auto redeemed = fixture.engine().redeem_for_eth(kHolder, unit);
  ASSERT_TRUE(redeemed.ok()) << redeemed.log;
  EXPECT_EQ(warden::schema::from_bytes32(
                warden::schema::make_hash32(redeemed.data)),
            5050);
  ASSERT_EQ(redeemed.events.size(), 1u);
  EXPECT_EQ(redeemed.events[0].type, "redemption");
  EXPECT_EQ(warden::schema::find_attribute(redeemed.events[0], "value"),
            "5050");

  EXPECT_EQ(fixture.host().balance_of(kHolder), 5050);
  EXPECT_EQ(fixture.engine().total_treasury(), 1'000'000 - 5050);
  EXPECT_EQ(fixture.registry().total_supply(), 99u);
  EXPECT_FALSE(fixture.registry().owner_of(unit).has_value());
}

TEST(redemption_integration, redeem_of_unowned_unit_neither_burns_nor_pays) {
  auto fixture = execution_fixture{"warden_redeem_unowned"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  auto unit = seed_members(fixture, 1'000'000, 10);

  auto result = fixture.engine().redeem_for_eth(make_account(0x52), unit);
  EXPECT_EQ(result.error(), error_code::caller_not_unit_owner);
  EXPECT_EQ(warden::schema::category_of(result.error()),
            warden::schema::error_category::authorization);
  EXPECT_EQ(fixture.registry().total_supply(), 10u);
  EXPECT_EQ(fixture.registry().owner_of(unit), kHolder);
  EXPECT_EQ(fixture.engine().total_treasury(), 1'000'000);
  EXPECT_EQ(fixture.host().balance_of(make_account(0x52)), 0);

  EXPECT_EQ(fixture.engine().redeem_for_eth(kHolder, 999).error(),
            error_code::unit_missing);
}

TEST(redemption_integration, live_obligations_are_set_aside) {
  auto fixture = execution_fixture{"warden_redeem_obligations"};
  ASSERT_TRUE(fixture.initialize(10000).ok());
  seed_members(fixture, 1'000'000, 100);

  auto actions = warden::schema::proposal_actions_t{};
  actions.targets = {make_account(1), make_account(2)};
  actions.values = {400'000, 1};
  actions.signatures = {"", ""};
  actions.datas = {{}, {}};
  ASSERT_FALSE(
      warden::schema::is_error(fixture.proposals().propose(actions)));
  ASSERT_FALSE(
      warden::schema::is_error(fixture.proposals().propose(actions)));
  ASSERT_FALSE(fixture.proposals()
                   .set_state(1, warden::schema::proposal_state_t::defeated)
                   .has_value());

  EXPECT_EQ(warden::schema::value_of(fixture.engine().allocated_treasury()),
            400'000);
  EXPECT_EQ(redemption_of(fixture), 6000);
}

TEST(redemption_integration, obligations_above_holdings_underflow) {
  auto fixture = execution_fixture{"warden_redeem_underflow"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  auto unit = seed_members(fixture, 100, 1);

  auto actions = warden::schema::proposal_actions_t{};
  actions.targets = {make_account(1), make_account(2)};
  actions.values = {101, 0};
  actions.signatures = {"", ""};
  actions.datas = {{}, {}};
  ASSERT_FALSE(
      warden::schema::is_error(fixture.proposals().propose(actions)));

  auto calculated = fixture.engine().calculate_redemption();
  ASSERT_TRUE(warden::schema::is_error(calculated));
  EXPECT_EQ(warden::schema::error_of(calculated).code,
            error_code::arithmetic_underflow);

  EXPECT_EQ(fixture.engine().redeem_for_eth(kHolder, unit).error(),
            error_code::arithmetic_underflow);
  EXPECT_EQ(fixture.registry().total_supply(), 1u);
}

TEST(redemption_integration, zero_supply_with_positive_rate_is_an_error) {
  auto fixture = execution_fixture{"warden_redeem_zero_supply"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  fixture.fund_treasury(1000);

  auto calculated = fixture.engine().calculate_redemption();
  ASSERT_TRUE(warden::schema::is_error(calculated));
  EXPECT_EQ(warden::schema::error_of(calculated).code,
            error_code::division_by_zero);

  ASSERT_TRUE(
      fixture.engine().set_redemption_rate(execution_fixture::admin(), 0).ok());
  EXPECT_EQ(redemption_of(fixture), 0);
}

TEST(redemption_integration, zero_rate_burns_and_pays_nothing) {
  auto fixture = execution_fixture{"warden_redeem_zero_rate"};
  ASSERT_TRUE(fixture.initialize(0).ok());
  auto unit = seed_members(fixture, 1000, 4);

  ASSERT_TRUE(fixture.engine().redeem_for_eth(kHolder, unit).ok());
  EXPECT_EQ(fixture.registry().total_supply(), 3u);
  EXPECT_EQ(fixture.engine().total_treasury(), 1000);
  EXPECT_EQ(fixture.host().balance_of(kHolder), 0);
}

TEST(redemption_integration, failed_burn_rolls_back) {
  auto fixture = execution_fixture{"warden_redeem_burn_failure"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  auto unit = seed_members(fixture, 1000, 2);
  fixture.registry().configure(execution_fixture::minter(),
                               execution_fixture::outsider());

  auto result = fixture.engine().redeem_for_eth(kHolder, unit);
  EXPECT_EQ(result.error(), error_code::burn_failed);
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(fixture.registry().total_supply(), 2u);
  EXPECT_EQ(fixture.engine().total_treasury(), 1000);
  EXPECT_EQ(fixture.host().balance_of(kHolder), 0);
}

TEST(redemption_integration, failed_payout_restores_burned_unit) {
  auto fixture = execution_fixture{"warden_redeem_payout_failure"};
  ASSERT_TRUE(fixture.initialize(10000).ok());
  auto unit = seed_members(fixture, 1000, 2);
  auto refusing = warden::testing::recording_contract{false};
  fixture.host().install(kHolder, refusing);

  auto result = fixture.engine().redeem_for_eth(kHolder, unit);
  EXPECT_EQ(result.error(), error_code::value_transfer_failed);
  EXPECT_EQ(refusing.calls().size(), 1u);
  EXPECT_EQ(fixture.registry().total_supply(), 2u);
  EXPECT_EQ(fixture.registry().owner_of(unit), kHolder);
  EXPECT_EQ(fixture.engine().total_treasury(), 1000);
  fixture.host().uninstall(kHolder);
}

TEST(redemption_integration, each_redemption_uses_current_aggregate_rate) {
  auto fixture = execution_fixture{"warden_redeem_sequence"};
  ASSERT_TRUE(fixture.initialize(5000).ok());
  fixture.fund_treasury(1'000'000);
  auto units = std::vector<warden::schema::unit_id_t>{};
  for (auto i = 0; i < 100; ++i) {
    units.push_back(fixture.mint_to(kHolder));
  }

  auto first = fixture.engine().redeem_for_eth(kHolder, units[0]);
  auto second = fixture.engine().redeem_for_eth(kHolder, units[1]);
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  auto paid_first =
      warden::schema::from_bytes32(warden::schema::make_hash32(first.data));
  auto paid_second =
      warden::schema::from_bytes32(warden::schema::make_hash32(second.data));
  EXPECT_EQ(paid_first, 5050);
  // pool 994,950 over 99 units: base 10,050, bonus 50.
  EXPECT_EQ(paid_second, 10050 * 5050 / 10000);
  EXPECT_EQ(fixture.host().balance_of(kHolder), paid_first + paid_second);
}
