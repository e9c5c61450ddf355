#pragma once
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <string_view>

namespace registrar::storage {

/// Typed accessors over one named collection of the shared database.
///
/// Values are SCALE encoded. Keys are stored as `collection|key`. A missing
/// key reads as std::nullopt (or the supplied default); an undecodable value
/// is logged and treated as missing.
class key_value_store final {
 public:
  using read_transaction_t = read_transaction<rocksdb_storage_tag>;
  using write_transaction_t = write_transaction<rocksdb_storage_tag>;

  explicit key_value_store(std::string_view collection);

  const std::string& collection() const { return collection_; }

  std::optional<std::string> get_string(std::string_view key,
                                        const read_transaction_t& tx) const;
  void set_string(std::string_view key,
                  const std::string& value,
                  write_transaction_t& tx) const;

  bool get_bool(std::string_view key,
                bool default_value,
                const read_transaction_t& tx) const;
  std::optional<bool> get_optional_bool(std::string_view key,
                                        const read_transaction_t& tx) const;
  void set_bool(std::string_view key, bool value, write_transaction_t& tx) const;

  std::optional<registrar::schema::timestamp_milliseconds_t> get_date(
      std::string_view key,
      const read_transaction_t& tx) const;
  void set_date(std::string_view key,
                registrar::schema::timestamp_milliseconds_t value,
                write_transaction_t& tx) const;

  std::optional<uint32_t> get_uint32(std::string_view key,
                                     const read_transaction_t& tx) const;
  void set_uint32(std::string_view key,
                  uint32_t value,
                  write_transaction_t& tx) const;

  /// UUIDs are persisted in their canonical string form.
  std::optional<registrar::schema::uuid_t> get_uuid(
      std::string_view key,
      const read_transaction_t& tx) const;
  void set_uuid(std::string_view key,
                const registrar::schema::uuid_t& value,
                write_transaction_t& tx) const;

  template <typename T>
  std::optional<T> get_object(std::string_view key,
                              const read_transaction_t& tx) const;
  template <typename T>
  void set_object(std::string_view key,
                  const T& value,
                  write_transaction_t& tx) const;

  bool has_value(std::string_view key, const read_transaction_t& tx) const;
  void remove_value(std::string_view key, write_transaction_t& tx) const;
  void remove_all(write_transaction_t& tx) const;

  std::string make_key(std::string_view key) const;

 private:
  std::string collection_;
  std::string prefix_;
};

template <typename T>
std::optional<T> key_value_store::get_object(
    std::string_view key,
    const read_transaction_t& tx) const {
  auto raw = tx.get(make_key(key));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = registrar::schema::encoding::scale_encoder_t{};
  auto decoded =
      encoder.try_decode<T>(registrar::schema::make_bytes_view(*raw));
  if (!decoded) {
    spdlog::warn("Ignoring undecodable value for '{}' in collection '{}'", key,
                 collection_);
  }
  return decoded;
}

template <typename T>
void key_value_store::set_object(std::string_view key,
                                 const T& value,
                                 write_transaction_t& tx) const {
  auto encoder = registrar::schema::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(value);
  tx.put(make_key(key), registrar::schema::make_bytes_view(encoded));
}

}  // namespace registrar::storage
