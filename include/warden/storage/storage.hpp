#pragma once
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// One element of an atomic write set. An empty value deletes the key.
using write_entry_t =
    std::pair<warden::schema::bytes_t, std::optional<warden::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Return the raw value at key, or std::nullopt when missing.
  std::optional<warden::schema::bytes_t> get(
      const warden::schema::bytes_view_t& key) const;

  /// Apply every put and delete in `writes` as one atomic batch.
  void apply(const std::vector<write_entry_t>& writes) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
