#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <provenance/common/critical.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

namespace provenance::storage {

namespace {

ROCKSDB_NAMESPACE::Options make_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  return options;
}

void open_database(storage<rocksdb_storage_tag>& store,
                   const ROCKSDB_NAMESPACE::Options& options,
                   const std::string_view& path) {
  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    provenance::common::critical(fmt::format("Failed to open RocksDB at {}", path),
                                 status.ToString());
  }
  store.database.reset(database);
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>{};
  open_database(store, make_options(), path);
  spdlog::info("Successfully opened RocksDB at {}", path);
  return store;
}

template <>
storage<rocksdb_storage_tag> make_memory_storage<rocksdb_storage_tag>() {
  auto store = storage<rocksdb_storage_tag>{};
  store.env.reset(ROCKSDB_NAMESPACE::NewMemEnv(ROCKSDB_NAMESPACE::Env::Default()));
  auto options = make_options();
  options.env = store.env.get();
  open_database(store, options, "/provenance-memory");
  spdlog::debug("Opened in-memory RocksDB");
  return store;
}

}  // namespace provenance::storage
