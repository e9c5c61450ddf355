#pragma once
#include <boost/uuid/uuid.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using uuid_t = boost::uuids::uuid;
using e164_t = std::string;
using timestamp_milliseconds_t = uint64_t;
using device_id_t = uint32_t;

inline constexpr device_id_t kPrimaryDeviceId = 1;

bytes_t make_bytes(const std::string& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
std::string make_string(const bytes_t& bytes);

/// Canonical upper-case 8-4-4-4-12 form, the persisted representation.
std::string to_string(const uuid_t& uuid);
std::optional<uuid_t> try_make_uuid(const std::string_view& text);
uuid_t make_uuid(const std::string_view& text);
uuid_t make_random_uuid();
std::string to_string(const std::optional<uuid_t>& uuid);

/// Structural E.164 check: '+' followed by 1 to 15 digits, no leading zero.
bool is_structurally_valid_e164(const std::string_view& number);

timestamp_milliseconds_t now_milliseconds();

}  // namespace registrar::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
