#pragma once
#include <ballot/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ballot::storage {

using key_value_entry_t =
    std::pair<ballot::schema::bytes_t, ballot::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ballot::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ballot::schema::bytes_view_t& key,
           const T& value) const;

  /// Atomically apply pre-encoded puts and deletes.
  void write_batch(const std::vector<key_value_entry_t>& puts,
                   const std::vector<ballot::schema::bytes_t>& deletes) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const ballot::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace ballot::storage
