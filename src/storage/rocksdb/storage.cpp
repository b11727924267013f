#include <xpii/common/critical.hpp>
#include <xpii/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace xpii::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto directory = std::filesystem::path{path};
  auto ec = std::error_code{};
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    xpii::common::critical("Cannot create audit store directory {}: {}", path,
                           ec.message());
  }

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  // RocksDB's own LOG stays quiet next to the ledger.
  options.info_log_level = ROCKSDB_NAMESPACE::InfoLogLevel::WARN_LEVEL;
  options.keep_log_file_num = 2;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, directory.string(),
                                            &database);
  if (!status.ok()) {
    xpii::common::critical("Cannot open audit store at {}: {}", path,
                           status.ToString());
  }
  spdlog::info("Opened audit store at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace xpii::storage
