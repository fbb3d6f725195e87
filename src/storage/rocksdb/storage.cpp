#include <zone/common/critical.hpp>
#include <zone/storage/rocksdb/storage.hpp>

namespace zone::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const open_mode mode) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = mode == open_mode::read_write;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      mode == open_mode::read_only
          ? ROCKSDB_NAMESPACE::DB::OpenForReadOnly(options, std::string{path},
                                                   &database)
          : ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    zone::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}{}", path,
               mode == open_mode::read_only ? " (read-only)" : "");
  store.database.reset(database);

  return store;
}
}  // namespace zone::storage
