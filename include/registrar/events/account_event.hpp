#pragma once

#include <registrar/schema/primitives.hpp>

#include <string_view>
#include <variant>

namespace registrar::events {

struct registration_state_changed final {
  bool operator==(const registration_state_changed&) const = default;
};

struct onboarding_state_changed final {
  bool operator==(const onboarding_state_changed&) const = default;
};

/// The local number, ACI or PNI may differ from what was last read,
/// including through a pending verification override.
struct local_identifiers_may_have_changed final {
  bool operator==(const local_identifiers_may_have_changed&) const = default;
};

using account_event_t = std::variant<registration_state_changed,
                                     onboarding_state_changed,
                                     local_identifiers_may_have_changed>;

inline std::string_view to_string(const account_event_t& event) {
  return std::visit(
      overloaded{[](const registration_state_changed&) {
                   return std::string_view{"registration_state_changed"};
                 },
                 [](const onboarding_state_changed&) {
                   return std::string_view{"onboarding_state_changed"};
                 },
                 [](const local_identifiers_may_have_changed&) {
                   return std::string_view{"local_identifiers_may_have_changed"};
                 }},
      event);
}

}  // namespace registrar::events
