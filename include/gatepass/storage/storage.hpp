#pragma once
#include <gatepass/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace gatepass::storage {

using key_value_entry_t =
    std::pair<gatepass::schema::bytes_t, gatepass::schema::bytes_t>;

enum class iteration_direction_t : uint8_t { forward = 0, reverse = 1 };

/// Return false to stop iteration early.
using prefix_visitor_t =
    std::function<bool(const gatepass::schema::bytes_view_t& key,
                       const gatepass::schema::bytes_view_t& value)>;

/// A read or write against the backend failed. Callers treat this as a
/// transient outage: nothing was committed.
struct storage_error final : std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const gatepass::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const gatepass::schema::bytes_view_t& key,
           const T& value) const;

  /// Commit all entries in one atomic write batch.
  void write(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const gatepass::schema::bytes_view_t& prefix) const;

  /// Visit key-value pairs under prefix in key order or reverse key order.
  void visit_by_prefix(const gatepass::schema::bytes_view_t& prefix,
                       iteration_direction_t direction,
                       const prefix_visitor_t& visitor) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace gatepass::storage
