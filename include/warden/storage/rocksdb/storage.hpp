#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace warden::storage {

namespace detail {

inline warden::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const warden::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  /// Commits are fsynced so a returned entry point survives a crash.
  bool sync_writes{true};

  std::optional<warden::schema::bytes_t> get(
      const warden::schema::bytes_view_t& key) const;
  void apply(const std::vector<write_entry_t>& writes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<warden::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const warden::schema::bytes_view_t& key) const {
  if (!database) {
    warden::common::critical("treasury state is not open");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    warden::common::critical("state read failed: {}", status.ToString());
  }
  return warden::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::apply(
    const std::vector<write_entry_t>& writes) const {
  if (!database) {
    warden::common::critical("treasury state is not open");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto status = value.has_value()
                      ? batch.Put(detail::to_slice(key),
                                  detail::to_slice(*value))
                      : batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      warden::common::critical("cannot stage state write: {}",
                               status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = sync_writes;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    warden::common::critical("cannot commit {} state writes: {}",
                             writes.size(), write_status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const warden::schema::bytes_view_t& prefix) const {
  if (!database) {
    warden::common::critical("treasury state is not open");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    warden::common::critical("state scan failed: {}",
                             iterator->status().ToString());
  }
  return entries;
}

}  // namespace warden::storage
