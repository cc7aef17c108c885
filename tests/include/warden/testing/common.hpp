#pragma once

#include <warden/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace warden::testing {

// Identities are distinguished by their first byte so failures print readably.
inline warden::schema::account_id_t make_account(const uint8_t seed) {
  auto account = warden::schema::account_id_t{};
  account[0] = seed;
  return account;
}

// Unique per call, so suites in one process never share a RocksDB directory.
inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  auto name = std::string{prefix};
  name += "_" + std::to_string(static_cast<unsigned long long>(stamp));
  name += "_" + std::to_string(counter.fetch_add(1));
  return (std::filesystem::temp_directory_path() / name).string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace warden::testing
