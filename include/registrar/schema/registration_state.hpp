#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Registration lifecycle as seen by consumers. Derived from an account
// snapshot, never persisted directly.
namespace registrar::schema {

enum class registration_state_t : uint8_t {
  unregistered = 0,
  registered = 1,
  deregistered = 2,
  reregistering = 3
};

inline constexpr auto kRegistrationStateMappings =
    enum_mappings_t<registration_state_t, 4>{
        std::pair<std::string_view, registration_state_t>{
            "unregistered", registration_state_t::unregistered},
        std::pair<std::string_view, registration_state_t>{
            "registered", registration_state_t::registered},
        std::pair<std::string_view, registration_state_t>{
            "deregistered", registration_state_t::deregistered},
        std::pair<std::string_view, registration_state_t>{
            "reregistering", registration_state_t::reregistering}};

template <>
inline std::optional<registration_state_t>
try_from_string<registration_state_t>(const std::string_view value) {
  return from_string(value, kRegistrationStateMappings);
}

inline constexpr std::string_view to_string(const registration_state_t value) {
  return to_string(value, kRegistrationStateMappings).value_or("unknown");
}

}  // namespace registrar::schema
