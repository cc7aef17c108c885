#pragma once

#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/event.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace warden::state {

using storage_t =
    warden::storage::storage<warden::storage::rocksdb_storage_tag>;

using event_listener_t =
    std::function<void(const warden::schema::event_record_t& record)>;

/// Layered write buffer over durable storage.
///
/// Every mutating operation runs inside a frame. Frames nest: committing an
/// inner frame folds its writes and events into the enclosing frame, reverting
/// it discards them. Committing the outermost frame flushes the accumulated
/// write set and the numbered event records to storage as one atomic batch.
/// Reads see the innermost pending value first.
class journal final {
 public:
  explicit journal(storage_t& storage);

  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;
  journal(journal&&) = delete;
  journal& operator=(journal&&) = delete;

  std::optional<warden::schema::bytes_t> get(
      const warden::schema::bytes_view_t& key) const;
  void put(const warden::schema::bytes_view_t& key,
           warden::schema::bytes_t value);
  void erase(const warden::schema::bytes_view_t& key);

  /// Decode the SCALE value at key.
  template <typename T>
  std::optional<T> read(const warden::schema::bytes_view_t& key) const;

  /// SCALE encode and stage value at key.
  template <typename T>
  void write(const warden::schema::bytes_view_t& key, const T& value);

  /// Stage an audit event in the current frame.
  void emit(warden::schema::event_t event);

  void begin();
  /// Close the innermost frame keeping its effects. Returns the events that
  /// frame carried.
  std::vector<warden::schema::event_t> commit();
  /// Close the innermost frame discarding its effects.
  void revert();
  std::size_t depth() const;

  /// Persisted event records with ids in the inclusive range.
  std::vector<warden::schema::event_record_t> events(uint64_t from_id,
                                                     uint64_t to_id) const;

  void set_event_listener(event_listener_t listener);

 private:
  struct frame final {
    std::map<warden::schema::bytes_t, std::optional<warden::schema::bytes_t>>
        writes;
    std::vector<warden::schema::event_t> events;
  };

  frame& top();
  void flush(frame& outermost);

  storage_t& storage_;
  std::vector<frame> frames_;
  event_listener_t listener_;
};

/// RAII frame. Reverts on destruction unless committed.
class scope final {
 public:
  explicit scope(journal& journal);
  ~scope();

  scope(const scope&) = delete;
  scope& operator=(const scope&) = delete;
  scope(scope&&) = delete;
  scope& operator=(scope&&) = delete;

  std::vector<warden::schema::event_t> commit();

 private:
  journal& journal_;
  bool open_{true};
};

template <typename T>
std::optional<T> journal::read(const warden::schema::bytes_view_t& key) const {
  auto raw = get(key);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  return encoder.decode<T>(
      warden::schema::bytes_view_t{raw->data(), raw->size()});
}

template <typename T>
void journal::write(const warden::schema::bytes_view_t& key, const T& value) {
  auto encoder = warden::schema::encoding::scale_encoder_t{};
  put(key, encoder.encode(value));
}

}  // namespace warden::state
