#include <registrar/storage/key_value_store.hpp>

namespace registrar::storage {

key_value_store::key_value_store(std::string_view collection)
    : collection_{collection}, prefix_{std::string{collection} + "|"} {}

std::string key_value_store::make_key(std::string_view key) const {
  auto out = prefix_;
  out.append(key);
  return out;
}

std::optional<std::string> key_value_store::get_string(
    std::string_view key,
    const read_transaction_t& tx) const {
  return get_object<std::string>(key, tx);
}

void key_value_store::set_string(std::string_view key,
                                 const std::string& value,
                                 write_transaction_t& tx) const {
  set_object(key, value, tx);
}

bool key_value_store::get_bool(std::string_view key,
                               const bool default_value,
                               const read_transaction_t& tx) const {
  return get_object<bool>(key, tx).value_or(default_value);
}

std::optional<bool> key_value_store::get_optional_bool(
    std::string_view key,
    const read_transaction_t& tx) const {
  return get_object<bool>(key, tx);
}

void key_value_store::set_bool(std::string_view key,
                               const bool value,
                               write_transaction_t& tx) const {
  set_object(key, value, tx);
}

std::optional<registrar::schema::timestamp_milliseconds_t>
key_value_store::get_date(std::string_view key,
                          const read_transaction_t& tx) const {
  return get_object<registrar::schema::timestamp_milliseconds_t>(key, tx);
}

void key_value_store::set_date(
    std::string_view key,
    const registrar::schema::timestamp_milliseconds_t value,
    write_transaction_t& tx) const {
  set_object(key, value, tx);
}

std::optional<uint32_t> key_value_store::get_uint32(
    std::string_view key,
    const read_transaction_t& tx) const {
  return get_object<uint32_t>(key, tx);
}

void key_value_store::set_uint32(std::string_view key,
                                 const uint32_t value,
                                 write_transaction_t& tx) const {
  set_object(key, value, tx);
}

std::optional<registrar::schema::uuid_t> key_value_store::get_uuid(
    std::string_view key,
    const read_transaction_t& tx) const {
  auto text = get_string(key, tx);
  if (!text) {
    return std::nullopt;
  }
  auto uuid = registrar::schema::try_make_uuid(*text);
  if (!uuid) {
    spdlog::warn("Ignoring malformed uuid '{}' for '{}'", *text, key);
  }
  return uuid;
}

void key_value_store::set_uuid(std::string_view key,
                               const registrar::schema::uuid_t& value,
                               write_transaction_t& tx) const {
  set_string(key, registrar::schema::to_string(value), tx);
}

bool key_value_store::has_value(std::string_view key,
                                const read_transaction_t& tx) const {
  return tx.get(make_key(key)).has_value();
}

void key_value_store::remove_value(std::string_view key,
                                   write_transaction_t& tx) const {
  tx.remove(make_key(key));
}

void key_value_store::remove_all(write_transaction_t& tx) const {
  auto keys = tx.list_keys(prefix_);
  for (const auto& key : keys) {
    tx.remove(key);
  }
  spdlog::debug("Removed {} value(s) from collection '{}'", keys.size(),
                collection_);
}

}  // namespace registrar::storage
