#include <gtest/gtest.h>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/state/journal.hpp>
#include <warden/testing/common.hpp>

#include <string>
#include <vector>

namespace {

warden::schema::bytes_t key(const std::string_view text) {
  return warden::schema::make_bytes(text);
}

warden::schema::bytes_view_t view(const warden::schema::bytes_t& bytes) {
  return warden::schema::bytes_view_t{bytes.data(), bytes.size()};
}

warden::schema::event_t make_event(const std::string& type) {
  return warden::schema::event_t{
      .type = type, .attributes = {{.key = "k", .value = type, .index = true}}};
}

class journal_fixture final {
 public:
  journal_fixture()
      : db_path_{warden::testing::make_db_path("warden_journal")},
        storage_{warden::storage::make_storage<
            warden::storage::rocksdb_storage_tag>(db_path_)},
        journal_{storage_} {}

  ~journal_fixture() { warden::testing::remove_path(db_path_); }

  journal_fixture(const journal_fixture&) = delete;
  journal_fixture& operator=(const journal_fixture&) = delete;

  std::optional<uint64_t> stored(const std::string_view name) {
    auto raw = storage_.get(view(key(name)));
    if (!raw) {
      return std::nullopt;
    }
    auto encoder = warden::schema::encoding::scale_encoder_t{};
    return encoder.decode<uint64_t>(view(*raw));
  }

  warden::state::journal& journal() { return journal_; }

 private:
  std::string db_path_;
  warden::state::storage_t storage_;
  warden::state::journal journal_;
};

}  // namespace

TEST(journal, outermost_commit_flushes_to_storage) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  {
    auto frame = warden::state::scope{journal};
    journal.write(view(key("X")), uint64_t{5});
    EXPECT_EQ(journal.read<uint64_t>(view(key("X"))), 5u);
    EXPECT_FALSE(fixture.stored("X").has_value());
    frame.commit();
  }
  EXPECT_EQ(fixture.stored("X"), 5u);
  EXPECT_EQ(journal.depth(), 0u);
}

TEST(journal, scope_reverts_unless_committed) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  {
    auto frame = warden::state::scope{journal};
    journal.write(view(key("X")), uint64_t{5});
    journal.emit(make_event("dropped"));
  }
  EXPECT_FALSE(journal.read<uint64_t>(view(key("X"))).has_value());
  EXPECT_FALSE(fixture.stored("X").has_value());
  EXPECT_TRUE(journal.events(0, 100).empty());
}

TEST(journal, inner_revert_keeps_outer_writes) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  auto outer = warden::state::scope{journal};
  journal.write(view(key("X")), uint64_t{1});
  {
    auto inner = warden::state::scope{journal};
    journal.write(view(key("X")), uint64_t{2});
    journal.write(view(key("Y")), uint64_t{3});
    EXPECT_EQ(journal.read<uint64_t>(view(key("X"))), 2u);
  }
  EXPECT_EQ(journal.read<uint64_t>(view(key("X"))), 1u);
  EXPECT_FALSE(journal.read<uint64_t>(view(key("Y"))).has_value());
  outer.commit();
  EXPECT_EQ(fixture.stored("X"), 1u);
  EXPECT_FALSE(fixture.stored("Y").has_value());
}

TEST(journal, inner_commit_folds_into_parent_and_outer_revert_drops_it) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  {
    auto outer = warden::state::scope{journal};
    {
      auto inner = warden::state::scope{journal};
      journal.write(view(key("X")), uint64_t{9});
      journal.emit(make_event("inner"));
      auto events = inner.commit();
      ASSERT_EQ(events.size(), 1u);
    }
    EXPECT_EQ(journal.read<uint64_t>(view(key("X"))), 9u);
  }
  EXPECT_FALSE(fixture.stored("X").has_value());
  EXPECT_TRUE(journal.events(0, 100).empty());
}

TEST(journal, erase_hides_stored_value) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  {
    auto frame = warden::state::scope{journal};
    journal.write(view(key("X")), uint64_t{5});
    frame.commit();
  }
  {
    auto frame = warden::state::scope{journal};
    journal.erase(view(key("X")));
    EXPECT_FALSE(journal.get(view(key("X"))).has_value());
    frame.commit();
  }
  EXPECT_FALSE(fixture.stored("X").has_value());
}

TEST(journal, events_are_numbered_and_queryable_by_range) {
  auto fixture = journal_fixture{};
  auto& journal = fixture.journal();
  auto delivered = std::vector<warden::schema::event_record_t>{};
  journal.set_event_listener(
      [&](const warden::schema::event_record_t& record) {
        delivered.push_back(record);
      });

  {
    auto frame = warden::state::scope{journal};
    journal.emit(make_event("first"));
    {
      auto inner = warden::state::scope{journal};
      journal.emit(make_event("second"));
      inner.commit();
    }
    auto events = frame.commit();
    EXPECT_EQ(events.size(), 2u);
  }
  {
    auto frame = warden::state::scope{journal};
    journal.emit(make_event("third"));
    frame.commit();
  }

  auto all = journal.events(0, 100);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].event_id, 0u);
  EXPECT_EQ(all[0].event.type, "first");
  EXPECT_EQ(all[1].event.type, "second");
  EXPECT_EQ(all[0].sequence, all[1].sequence);
  EXPECT_EQ(all[2].event_id, 2u);
  EXPECT_EQ(all[2].sequence, all[0].sequence + 1);
  EXPECT_EQ(warden::schema::find_attribute(all[2].event, "k"), "third");
  EXPECT_TRUE(all[2].event.attributes[0].index);

  auto tail = journal.events(1, 1);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].event.type, "second");

  ASSERT_EQ(delivered.size(), 3u);
  EXPECT_EQ(delivered[2].event.type, "third");
}
