#pragma once
#include <rocksdb/db.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <gatepass/schema/encoding/scale/encoder.hpp>
#include <gatepass/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace gatepass::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const gatepass::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline gatepass::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return gatepass::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline gatepass::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return gatepass::schema::make_bytes(to_bytes_view(slice));
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const gatepass::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const gatepass::schema::bytes_view_t& key,
           const T& value) const;

  void write(const std::vector<key_value_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const gatepass::schema::bytes_view_t& prefix) const;
  void visit_by_prefix(const gatepass::schema::bytes_view_t& prefix,
                       iteration_direction_t direction,
                       const prefix_visitor_t& visitor) const;

 private:
  ROCKSDB_NAMESPACE::DB& open_database() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const gatepass::schema::bytes_view_t& key) const {
  auto& db = open_database();
  auto value = std::string{};
  auto status =
      db.Get(ROCKSDB_NAMESPACE::ReadOptions{}, detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"failed to get value from RocksDB"};
  }
  auto decoded = encoder.template try_decode<T>(
      gatepass::schema::make_bytes_view(value));
  if (!decoded) {
    spdlog::error("Stored value at key {} failed to decode",
                  gatepass::schema::to_hex(key));
    throw storage_error{"stored value failed to decode"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const gatepass::schema::bytes_view_t& key,
    const T& value) const {
  auto& db = open_database();
  auto encoded_value = encoder.encode(value);
  auto status = db.Put(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
                       detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw storage_error{"failed to put value into RocksDB"};
  }
}

}  // namespace gatepass::storage
