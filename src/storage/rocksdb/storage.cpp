#include <ballot/common/critical.hpp>
#include <ballot/storage/rocksdb/storage.hpp>

namespace ballot::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // Governance state is small and written rarely; favour integrity checks
  // and a bounded info log over write throughput.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  options.max_open_files = 256;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    ballot::common::critical("Cannot open governance store at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Governance store ready at {}", path);
  store.database.reset(database);

  return store;
}
}  // namespace ballot::storage
