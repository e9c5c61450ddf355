#pragma once

#include <registrar/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace registrar::testing {

/// Deterministic ACI/PNI whose every byte is derived from seed.
inline registrar::schema::uuid_t make_uuid(const uint8_t seed) {
  auto out = registrar::schema::uuid_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out.data[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace registrar::testing
