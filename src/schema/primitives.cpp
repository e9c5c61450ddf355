#include <registrar/common/critical.hpp>
#include <registrar/schema/primitives.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iterator>
#include <string>
#include <string_view>

namespace registrar::schema {

namespace {

// Only the hyphenated 8-4-4-4-12 form is accepted. string_generator alone
// would also take braces and undashed input.
std::optional<uuid_t> try_make_uuid_internal(std::string_view text) {
  static constexpr auto kDashPositions = std::array<std::size_t, 4>{8, 13, 18, 23};
  if (text.size() != 36) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto is_dash_position =
        std::ranges::find(kDashPositions, i) != std::end(kDashPositions);
    const auto c = static_cast<unsigned char>(text[i]);
    if (is_dash_position ? c != '-' : !std::isxdigit(c)) {
      return std::nullopt;
    }
  }
  return boost::uuids::string_generator{}(std::string{text});
}

}  // namespace

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_string(const uuid_t& uuid) {
  auto out = boost::uuids::to_string(uuid);
  std::ranges::transform(out, std::begin(out), [](const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return out;
}

std::string to_string(const std::optional<uuid_t>& uuid) {
  if (!uuid) {
    return "<none>";
  }
  return schema::to_string(*uuid);
}

std::optional<uuid_t> try_make_uuid(const std::string_view& text) {
  return try_make_uuid_internal(text);
}

uuid_t make_uuid(const std::string_view& text) {
  auto uuid = try_make_uuid_internal(text);
  if (!uuid.has_value()) {
    registrar::common::critical("invalid uuid input");
  }
  return *uuid;
}

uuid_t make_random_uuid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return generator();
}

bool is_structurally_valid_e164(const std::string_view& number) {
  if (number.size() < 2 || number.size() > 16 || number.front() != '+') {
    return false;
  }
  if (number[1] == '0') {
    return false;
  }
  return std::all_of(std::next(std::begin(number)), std::end(number),
                     [](const char c) {
                       return std::isdigit(static_cast<unsigned char>(c)) != 0;
                     });
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace registrar::schema
