#pragma once

#include <registrar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Which of the account's identifiers a protocol store belongs to.
namespace registrar::schema {

enum class identity_kind_t : uint8_t { aci = 0, pni = 1 };

inline constexpr auto kIdentityKindMappings = enum_mappings_t<identity_kind_t, 2>{
    std::pair<std::string_view, identity_kind_t>{"aci", identity_kind_t::aci},
    std::pair<std::string_view, identity_kind_t>{"pni", identity_kind_t::pni}};

template <>
inline std::optional<identity_kind_t> try_from_string<identity_kind_t>(
    const std::string_view value) {
  return from_string(value, kIdentityKindMappings);
}

inline constexpr std::string_view to_string(const identity_kind_t value) {
  return to_string(value, kIdentityKindMappings).value_or("unknown");
}

}  // namespace registrar::schema
