#include <gtest/gtest.h>
#include <warden/membership/registry.hpp>
#include <warden/testing/execution_fixture.hpp>
#include <warden/timelock/fingerprint.hpp>

namespace {

using warden::testing::execution_fixture;
using warden::testing::make_account;

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(registry, only_minter_can_mint) {
  auto fixture = execution_fixture{"warden_registry_mint"};
  fixture.initialize();
  auto& registry = fixture.registry();

  auto rejected = registry.mint(make_account(9), make_account(1));
  ASSERT_TRUE(warden::schema::is_error(rejected));
  EXPECT_EQ(warden::schema::error_of(rejected).code,
            warden::schema::error_code::caller_not_minter);

  auto first = registry.mint(execution_fixture::minter(), make_account(1));
  auto second = registry.mint(execution_fixture::minter(), make_account(2));
  ASSERT_FALSE(warden::schema::is_error(first));
  ASSERT_FALSE(warden::schema::is_error(second));
  EXPECT_EQ(warden::schema::value_of(first), 0u);
  EXPECT_EQ(warden::schema::value_of(second), 1u);
  EXPECT_EQ(registry.total_supply(), 2u);
  EXPECT_EQ(registry.owner_of(1), make_account(2));
}

TEST(registry, owner_or_burner_can_burn) {
  auto fixture = execution_fixture{"warden_registry_burn"};
  fixture.initialize();
  auto& registry = fixture.registry();
  auto unit_a = fixture.mint_to(make_account(1));
  auto unit_b = fixture.mint_to(make_account(1));

  auto error = registry.burn(make_account(2), unit_a);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, warden::schema::error_code::caller_not_unit_owner);

  EXPECT_FALSE(registry.burn(make_account(1), unit_a).has_value());
  EXPECT_FALSE(
      registry.burn(execution_fixture::treasury_address(), unit_b).has_value());
  EXPECT_EQ(registry.total_supply(), 0u);
  EXPECT_FALSE(registry.owner_of(unit_a).has_value());

  auto missing = registry.burn(make_account(1), unit_a);
  ASSERT_TRUE(missing.has_value());
  EXPECT_EQ(missing->code, warden::schema::error_code::unit_missing);
}

TEST(registry, burn_is_reachable_through_invoke) {
  auto fixture = execution_fixture{"warden_registry_invoke"};
  fixture.initialize();
  auto unit = fixture.mint_to(make_account(1));

  auto payload =
      warden::timelock::encode_call(warden::membership::kBurnSignature, unit);
  auto denied = fixture.host().invoke(make_account(7),
                                      execution_fixture::registry_address(), 0,
                                      view(payload));
  EXPECT_FALSE(denied.success);
  EXPECT_EQ(fixture.registry().total_supply(), 1u);

  auto burned = fixture.host().invoke(make_account(1),
                                      execution_fixture::registry_address(), 0,
                                      view(payload));
  EXPECT_TRUE(burned.success);
  EXPECT_EQ(fixture.registry().total_supply(), 0u);
}

TEST(registry, unknown_selector_is_rejected) {
  auto fixture = execution_fixture{"warden_registry_unknown"};
  fixture.initialize();
  auto payload = warden::timelock::encode_call("transfer(uint64)", uint64_t{1});
  EXPECT_FALSE(fixture.host()
                   .invoke(make_account(1),
                           execution_fixture::registry_address(), 0,
                           view(payload))
                   .success);
}
