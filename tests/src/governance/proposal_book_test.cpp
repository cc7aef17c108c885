#include <gtest/gtest.h>
#include <warden/governance/proposal_book.hpp>
#include <warden/testing/execution_fixture.hpp>

namespace {

using warden::testing::execution_fixture;
using warden::testing::make_account;

warden::schema::proposal_actions_t make_actions(
    const std::vector<warden::schema::amount_t>& values) {
  auto actions = warden::schema::proposal_actions_t{};
  for (std::size_t i = 0; i < values.size(); ++i) {
    actions.targets.push_back(make_account(static_cast<uint8_t>(i + 1)));
    actions.values.push_back(values[i]);
    actions.signatures.emplace_back();
    actions.datas.emplace_back();
  }
  return actions;
}

}  // namespace

TEST(proposal_book, propose_records_actions_as_pending) {
  auto fixture = execution_fixture{"warden_proposal_book_propose"};
  auto& book = fixture.proposals();
  EXPECT_EQ(book.proposal_count(), 0u);

  auto actions = make_actions({10, 20});
  actions.signatures[1] = "ping()";
  actions.datas[1] = warden::schema::bytes_t{0x01};
  auto index = book.propose(actions);
  ASSERT_FALSE(warden::schema::is_error(index));
  EXPECT_EQ(warden::schema::value_of(index), 0u);
  EXPECT_EQ(book.proposal_count(), 1u);
  EXPECT_EQ(book.state(0), warden::schema::proposal_state_t::pending);

  auto stored = book.get_actions(0);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->targets, actions.targets);
  EXPECT_EQ(stored->values, actions.values);
  EXPECT_EQ(stored->signatures, actions.signatures);
  EXPECT_EQ(stored->datas, actions.datas);
}

TEST(proposal_book, propose_rejects_uneven_arrays) {
  auto fixture = execution_fixture{"warden_proposal_book_uneven"};
  auto actions = make_actions({10, 20});
  actions.datas.pop_back();
  auto index = fixture.proposals().propose(actions);
  ASSERT_TRUE(warden::schema::is_error(index));
  EXPECT_EQ(warden::schema::error_of(index).code,
            warden::schema::error_code::proposal_malformed);
  EXPECT_EQ(fixture.proposals().proposal_count(), 0u);
}

TEST(proposal_book, set_state_updates_known_proposals_only) {
  auto fixture = execution_fixture{"warden_proposal_book_state"};
  auto& book = fixture.proposals();
  ASSERT_FALSE(warden::schema::is_error(book.propose(make_actions({1}))));

  EXPECT_FALSE(
      book.set_state(0, warden::schema::proposal_state_t::executed).has_value());
  EXPECT_EQ(book.state(0), warden::schema::proposal_state_t::executed);

  auto error = book.set_state(4, warden::schema::proposal_state_t::active);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, warden::schema::error_code::proposal_missing);
  EXPECT_FALSE(book.state(4).has_value());
  EXPECT_FALSE(book.get_actions(4).has_value());
}
