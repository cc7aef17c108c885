#include <gtest/gtest.h>
#include <warden/runtime/host.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/testing/contracts.hpp>
#include <warden/testing/execution_fixture.hpp>

namespace {

using warden::testing::make_account;

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(host, deposit_credits_balance) {
  auto fixture = warden::testing::execution_fixture{"warden_host_deposit"};
  auto& host = fixture.host();
  EXPECT_EQ(host.balance_of(make_account(1)), 0);
  host.deposit(make_account(1), 100);
  host.deposit(make_account(1), 23);
  EXPECT_EQ(host.balance_of(make_account(1)), 123);
}

TEST(host, invoke_moves_value_to_account_without_code) {
  auto fixture = warden::testing::execution_fixture{"warden_host_plain"};
  auto& host = fixture.host();
  host.deposit(make_account(1), 100);

  auto outcome = host.invoke(make_account(1), make_account(2), 40, {});
  EXPECT_TRUE(outcome.success);
  EXPECT_TRUE(outcome.return_data.empty());
  EXPECT_EQ(host.balance_of(make_account(1)), 60);
  EXPECT_EQ(host.balance_of(make_account(2)), 40);
}

TEST(host, invoke_fails_without_funds_and_changes_nothing) {
  auto fixture = warden::testing::execution_fixture{"warden_host_funds"};
  auto& host = fixture.host();
  auto target = warden::testing::recording_contract{};
  host.install(make_account(2), target);
  host.deposit(make_account(1), 10);

  auto outcome = host.invoke(make_account(1), make_account(2), 11, {});
  EXPECT_FALSE(outcome.success);
  EXPECT_TRUE(target.calls().empty());
  EXPECT_EQ(host.balance_of(make_account(1)), 10);
  EXPECT_EQ(host.balance_of(make_account(2)), 0);
  host.uninstall(make_account(2));
}

TEST(host, invoke_passes_context_and_return_data) {
  auto fixture = warden::testing::execution_fixture{"warden_host_context"};
  auto& host = fixture.host();
  auto target =
      warden::testing::recording_contract{true, warden::schema::bytes_t{0xAA}};
  host.install(make_account(2), target);
  host.deposit(make_account(1), 5);

  auto payload = warden::schema::bytes_t{0x01, 0x02};
  auto outcome = host.invoke(make_account(1), make_account(2), 5, view(payload));
  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.return_data, warden::schema::bytes_t{0xAA});
  ASSERT_EQ(target.calls().size(), 1u);
  const auto& call = target.calls()[0];
  EXPECT_EQ(call.context.caller, make_account(1));
  EXPECT_EQ(call.context.self, make_account(2));
  EXPECT_EQ(call.context.value, 5);
  EXPECT_EQ(call.context.now, fixture.now());
  EXPECT_EQ(call.payload, payload);
  host.uninstall(make_account(2));
}

TEST(host, failed_handler_reverts_value_and_its_writes) {
  auto fixture = warden::testing::execution_fixture{"warden_host_revert"};
  auto& host = fixture.host();
  auto marker = warden::schema::key::make_key("TEST|MARKER");
  auto target = warden::testing::callback_contract{
      [&](const warden::runtime::call_context_t&,
          const warden::schema::bytes_view_t&) {
        host.journal().write(view(marker), uint64_t{1});
        return warden::runtime::call_outcome_t{};
      }};
  host.install(make_account(2), target);
  host.deposit(make_account(1), 50);

  auto outcome = host.invoke(make_account(1), make_account(2), 50, {});
  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(host.balance_of(make_account(1)), 50);
  EXPECT_EQ(host.balance_of(make_account(2)), 0);
  EXPECT_FALSE(host.journal().get(view(marker)).has_value());
  host.uninstall(make_account(2));
}

TEST(host, nested_failure_only_reverts_inner_call) {
  auto fixture = warden::testing::execution_fixture{"warden_host_nested"};
  auto& host = fixture.host();
  auto failing = warden::testing::recording_contract{false};
  auto forwarding = warden::testing::callback_contract{
      [&](const warden::runtime::call_context_t& context,
          const warden::schema::bytes_view_t&) {
        auto inner = host.invoke(context.self, make_account(3), 10, {});
        EXPECT_FALSE(inner.success);
        return warden::runtime::call_outcome_t{.success = true,
                                               .return_data = {}};
      }};
  host.install(make_account(2), forwarding);
  host.install(make_account(3), failing);
  host.deposit(make_account(1), 30);

  auto outcome = host.invoke(make_account(1), make_account(2), 30, {});
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(host.balance_of(make_account(2)), 30);
  EXPECT_EQ(host.balance_of(make_account(3)), 0);
  EXPECT_EQ(failing.calls().size(), 1u);
  host.uninstall(make_account(2));
  host.uninstall(make_account(3));
}

TEST(host, clock_frame_holds_one_reading_for_nested_invokes) {
  auto fixture = warden::testing::execution_fixture{"warden_host_clock"};
  auto& host = fixture.host();
  auto inner = warden::testing::recording_contract{};
  auto outer = warden::testing::callback_contract{
      [&](const warden::runtime::call_context_t&,
          const warden::schema::bytes_view_t&) {
        fixture.advance(60);
        return host.invoke(make_account(3), make_account(2), 0, {});
      }};
  host.install(make_account(2), inner);
  host.install(make_account(3), outer);
  auto start = fixture.now();

  {
    auto clock = warden::runtime::clock_frame{host};
    auto nested = warden::runtime::clock_frame{host};
    EXPECT_EQ(clock.now(), start);
    EXPECT_TRUE(host.invoke(make_account(1), make_account(3), 0, {}).success);
    ASSERT_EQ(inner.calls().size(), 1u);
    EXPECT_EQ(inner.calls()[0].context.now, start);
    EXPECT_EQ(nested.now(), start);
    EXPECT_EQ(host.now(), start);
  }
  EXPECT_EQ(host.now(), start + 60);

  host.uninstall(make_account(3));
  host.uninstall(make_account(2));
}

TEST(host, call_depth_is_bounded) {
  auto fixture = warden::testing::execution_fixture{"warden_host_depth"};
  auto& host = fixture.host();
  auto entered = std::size_t{};
  auto recursive = warden::testing::callback_contract{
      [&](const warden::runtime::call_context_t& context,
          const warden::schema::bytes_view_t&) {
        ++entered;
        host.invoke(context.self, context.self, 0, {});
        return warden::runtime::call_outcome_t{.success = true,
                                               .return_data = {}};
      }};
  host.install(make_account(2), recursive);

  EXPECT_TRUE(host.invoke(make_account(1), make_account(2), 0, {}).success);
  EXPECT_EQ(entered, warden::runtime::kMaxCallDepth);
  host.uninstall(make_account(2));
}
