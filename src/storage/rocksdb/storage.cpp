#include <warden/common/critical.hpp>
#include <warden/storage/rocksdb/storage.hpp>
#include <filesystem>
#include <system_error>

namespace warden::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto error = std::error_code{};
  const auto existed = std::filesystem::exists(std::string{path}, error);

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    warden::common::critical("cannot open treasury state at {}: {}", path,
                             status.ToString());
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  if (existed) {
    spdlog::info("Reopened treasury state at {}", path);
  } else {
    spdlog::info("Created treasury state at {}", path);
  }
  return store;
}

}  // namespace warden::storage
