#include <gtest/gtest.h>
#include <warden/testing/execution_fixture.hpp>
#include <warden/timelock/admin_authority.hpp>

namespace {

using warden::testing::execution_fixture;
using warden::testing::make_account;

std::optional<warden::schema::error_t> initialize_with_delay(
    const warden::schema::duration_seconds_t delay) {
  auto fixture = execution_fixture{"warden_admin_authority_bounds"};
  auto authority = warden::timelock::admin_authority{fixture.journal()};
  auto frame = warden::state::scope{fixture.journal()};
  return authority.initialize(make_account(1), delay);
}

}  // namespace

TEST(admin_authority, delay_bounds_are_inclusive) {
  EXPECT_EQ(warden::timelock::kMinimumDelay, 172800u);
  EXPECT_EQ(warden::timelock::kMaximumDelay, 2592000u);

  auto below = initialize_with_delay(warden::timelock::kMinimumDelay - 1);
  ASSERT_TRUE(below.has_value());
  EXPECT_EQ(below->code, warden::schema::error_code::delay_below_minimum);

  auto above = initialize_with_delay(warden::timelock::kMaximumDelay + 1);
  ASSERT_TRUE(above.has_value());
  EXPECT_EQ(above->code, warden::schema::error_code::delay_above_maximum);

  EXPECT_FALSE(initialize_with_delay(warden::timelock::kMinimumDelay));
  EXPECT_FALSE(initialize_with_delay(warden::timelock::kMaximumDelay));
}

TEST(admin_authority, initialize_stores_admin_once) {
  auto fixture = execution_fixture{"warden_admin_authority_init"};
  auto authority = warden::timelock::admin_authority{fixture.journal()};
  auto frame = warden::state::scope{fixture.journal()};
  EXPECT_FALSE(authority.initialized());
  EXPECT_FALSE(authority.admin().has_value());

  EXPECT_FALSE(authority.initialize(make_account(1), 3 * 86400).has_value());
  EXPECT_TRUE(authority.initialized());
  EXPECT_EQ(authority.admin(), make_account(1));
  EXPECT_FALSE(authority.pending_admin().has_value());
  EXPECT_EQ(authority.delay(), 3u * 86400u);

  auto again = authority.initialize(make_account(2), 3 * 86400);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->code, warden::schema::error_code::already_initialized);
  EXPECT_EQ(authority.admin(), make_account(1));
}

TEST(admin_authority, zero_admin_is_rejected) {
  auto fixture = execution_fixture{"warden_admin_authority_zero"};
  auto authority = warden::timelock::admin_authority{fixture.journal()};
  auto frame = warden::state::scope{fixture.journal()};
  auto error = authority.initialize(warden::schema::make_zero_hash(),
                                    warden::timelock::kMinimumDelay);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, warden::schema::error_code::caller_not_admin);
  EXPECT_FALSE(authority.initialized());
}

TEST(admin_authority, require_admin_and_accept_admin_check_identity) {
  auto fixture = execution_fixture{"warden_admin_authority_identity"};
  auto authority = warden::timelock::admin_authority{fixture.journal()};
  auto frame = warden::state::scope{fixture.journal()};
  ASSERT_FALSE(authority.initialize(make_account(1),
                                    warden::timelock::kMinimumDelay));

  EXPECT_FALSE(authority.require_admin(make_account(1), "op").has_value());
  auto denied = authority.require_admin(make_account(2), "op");
  ASSERT_TRUE(denied.has_value());
  EXPECT_EQ(denied->code, warden::schema::error_code::caller_not_admin);

  // No pending admin: nobody, not even the zero identity, can claim.
  auto unclaimed = authority.accept_admin(warden::schema::make_zero_hash());
  ASSERT_TRUE(unclaimed.has_value());
  EXPECT_EQ(unclaimed->code,
            warden::schema::error_code::caller_not_pending_admin);
  EXPECT_EQ(authority.admin(), make_account(1));
}
