#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/schema/key/engine_keys.hpp>
#include <warden/state/journal.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

namespace warden::state {

namespace {

using encoder_t = warden::schema::encoding::scale_encoder_t;
using encoded_attribute_t = std::tuple<std::string, std::string, bool>;
using encoded_record_t = std::tuple<uint64_t,
                                    uint64_t,
                                    std::string,
                                    std::vector<encoded_attribute_t>>;

warden::schema::bytes_t encode_record(
    const warden::schema::event_record_t& record) {
  auto attributes = std::vector<encoded_attribute_t>{};
  attributes.reserve(record.event.attributes.size());
  for (const auto& attribute : record.event.attributes) {
    attributes.emplace_back(attribute.key, attribute.value, attribute.index);
  }
  auto encoder = encoder_t{};
  return encoder.encode(encoded_record_t{record.event_id, record.sequence,
                                         record.event.type, attributes});
}

std::optional<warden::schema::event_record_t> decode_record(
    const warden::schema::bytes_t& raw) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<encoded_record_t>(
      warden::schema::bytes_view_t{raw.data(), raw.size()});
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto record = warden::schema::event_record_t{};
  record.event_id = std::get<0>(*decoded);
  record.sequence = std::get<1>(*decoded);
  record.event.type = std::get<2>(*decoded);
  for (auto& [key, value, index] : std::get<3>(*decoded)) {
    record.event.attributes.push_back(warden::schema::event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = index});
  }
  return record;
}

}  // namespace

journal::journal(storage_t& storage) : storage_{storage} {}

std::optional<warden::schema::bytes_t> journal::get(
    const warden::schema::bytes_view_t& key) const {
  auto owned = warden::schema::make_bytes(key);
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    auto found = it->writes.find(owned);
    if (found != std::end(it->writes)) {
      return found->second;
    }
  }
  return storage_.get(key);
}

void journal::put(const warden::schema::bytes_view_t& key,
                  warden::schema::bytes_t value) {
  top().writes.insert_or_assign(warden::schema::make_bytes(key),
                                std::optional{std::move(value)});
}

void journal::erase(const warden::schema::bytes_view_t& key) {
  top().writes.insert_or_assign(warden::schema::make_bytes(key),
                                std::optional<warden::schema::bytes_t>{});
}

void journal::emit(warden::schema::event_t event) {
  top().events.push_back(std::move(event));
}

void journal::begin() {
  frames_.emplace_back();
}

std::vector<warden::schema::event_t> journal::commit() {
  if (frames_.empty()) {
    warden::common::critical("journal commit without an open frame");
  }
  auto closing = std::move(frames_.back());
  frames_.pop_back();
  auto events = closing.events;

  if (frames_.empty()) {
    flush(closing);
    return events;
  }

  auto& parent = frames_.back();
  for (auto& [key, value] : closing.writes) {
    parent.writes.insert_or_assign(key, std::move(value));
  }
  parent.events.insert(std::end(parent.events),
                       std::make_move_iterator(std::begin(closing.events)),
                       std::make_move_iterator(std::end(closing.events)));
  return events;
}

void journal::revert() {
  if (frames_.empty()) {
    warden::common::critical("journal revert without an open frame");
  }
  spdlog::debug("Reverting journal frame at depth {} ({} staged write(s))",
                frames_.size(), frames_.back().writes.size());
  frames_.pop_back();
}

std::size_t journal::depth() const {
  return frames_.size();
}

std::vector<warden::schema::event_record_t> journal::events(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto records = std::vector<warden::schema::event_record_t>{};
  auto prefix = warden::schema::key::make_key(warden::schema::key::kEventPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(
           warden::schema::bytes_view_t{prefix.data(), prefix.size()})) {
    auto event_id = warden::schema::key::parse_event_key(
        warden::schema::bytes_view_t{key.data(), key.size()});
    if (!event_id || *event_id < from_id || *event_id > to_id) {
      continue;
    }
    auto record = decode_record(value);
    if (!record) {
      spdlog::warn("Skipping undecodable event record {}", *event_id);
      continue;
    }
    records.push_back(std::move(*record));
  }
  return records;
}

void journal::set_event_listener(event_listener_t listener) {
  listener_ = std::move(listener);
}

journal::frame& journal::top() {
  if (frames_.empty()) {
    warden::common::critical("state write outside of a journal frame");
  }
  return frames_.back();
}

void journal::flush(frame& outermost) {
  if (outermost.writes.empty() && outermost.events.empty()) {
    return;
  }

  auto encoder = encoder_t{};
  auto event_seq_key = warden::schema::key::make_key(
      warden::schema::key::kEventSeqKey);
  auto commit_seq_key = warden::schema::key::make_key(
      warden::schema::key::kCommitSeqKey);
  auto read_counter = [&](const warden::schema::bytes_t& key) {
    auto raw = storage_.get(warden::schema::bytes_view_t{key.data(), key.size()});
    if (!raw) {
      return uint64_t{};
    }
    return encoder.decode<uint64_t>(
        warden::schema::bytes_view_t{raw->data(), raw->size()});
  };

  auto next_event_id = read_counter(event_seq_key);
  auto sequence = read_counter(commit_seq_key);

  auto writes = std::vector<warden::storage::write_entry_t>{};
  writes.reserve(outermost.writes.size() + outermost.events.size() + 2);
  for (auto& [key, value] : outermost.writes) {
    writes.emplace_back(key, std::move(value));
  }

  auto records = std::vector<warden::schema::event_record_t>{};
  records.reserve(outermost.events.size());
  for (auto& event : outermost.events) {
    auto record = warden::schema::event_record_t{
        .event_id = next_event_id++, .sequence = sequence, .event = event};
    writes.emplace_back(warden::schema::key::make_event_key(record.event_id),
                        encode_record(record));
    records.push_back(std::move(record));
  }
  writes.emplace_back(event_seq_key, encoder.encode(next_event_id));
  writes.emplace_back(commit_seq_key, encoder.encode(sequence + 1));

  storage_.apply(writes);
  spdlog::debug("Flushed commit {} with {} write(s) and {} event(s)", sequence,
                outermost.writes.size(), records.size());

  if (listener_) {
    for (const auto& record : records) {
      listener_(record);
    }
  }
}

scope::scope(journal& journal) : journal_{journal} {
  journal_.begin();
}

scope::~scope() {
  if (open_) {
    journal_.revert();
  }
}

std::vector<warden::schema::event_t> scope::commit() {
  open_ = false;
  return journal_.commit();
}

}  // namespace warden::state
