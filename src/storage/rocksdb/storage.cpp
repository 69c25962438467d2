#include <gatepass/common/critical.hpp>
#include <gatepass/storage/rocksdb/storage.hpp>

#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

namespace gatepass::storage {

namespace {

bool has_prefix(const ROCKSDB_NAMESPACE::Slice& key,
                const ROCKSDB_NAMESPACE::Slice& prefix) {
  return key.starts_with(prefix);
}

/// Smallest key greater than every key sharing prefix, or std::nullopt when
/// the prefix is all 0xFF bytes.
std::optional<std::string> prefix_successor(std::string prefix) {
  while (!prefix.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(prefix.back());
    if (last != 0xFF) {
      ++last;
      return prefix;
    }
    prefix.pop_back();
  }
  return std::nullopt;
}

}  // namespace

ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::open_database() const {
  if (!database) {
    throw storage_error{"RocksDB database is not open"};
  }
  return *database;
}

void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  auto& db = open_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      spdlog::error("Failed to stage write batch entry: {}",
                    put_status.ToString());
      throw storage_error{"failed to stage write batch entry"};
    }
  }
  auto write_status = db.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    throw storage_error{"failed to commit write batch"};
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const gatepass::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  visit_by_prefix(prefix, iteration_direction_t::forward,
                  [&](const gatepass::schema::bytes_view_t& key,
                      const gatepass::schema::bytes_view_t& value) {
                    entries.emplace_back(gatepass::schema::make_bytes(key),
                                         gatepass::schema::make_bytes(value));
                    return true;
                  });
  return entries;
}

void storage<rocksdb_storage_tag>::visit_by_prefix(
    const gatepass::schema::bytes_view_t& prefix,
    const iteration_direction_t direction,
    const prefix_visitor_t& visitor) const {
  auto& db = open_database();
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      db.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};

  if (direction == iteration_direction_t::forward) {
    iterator->Seek(prefix_slice);
  } else {
    auto successor = prefix_successor(prefix_slice.ToString());
    if (successor) {
      iterator->SeekForPrev(*successor);
      if (iterator->Valid() && iterator->key() == *successor) {
        iterator->Prev();
      }
    } else {
      iterator->SeekToLast();
    }
  }

  while (iterator->Valid() && has_prefix(iterator->key(), prefix_slice)) {
    if (!visitor(detail::to_bytes_view(iterator->key()),
                 detail::to_bytes_view(iterator->value()))) {
      return;
    }
    if (direction == iteration_direction_t::forward) {
      iterator->Next();
    } else {
      iterator->Prev();
    }
  }

  auto status = iterator->status();
  if (!status.ok()) {
    spdlog::error("RocksDB iteration failed: {}", status.ToString());
    throw storage_error{"RocksDB iteration failed"};
  }
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    gatepass::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace gatepass::storage
