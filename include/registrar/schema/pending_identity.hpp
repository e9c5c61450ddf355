#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>

namespace registrar::schema {

/// Identity of an in-flight registration attempt. Lives only in memory and
/// overrides the confirmed fields until the attempt is confirmed or reset.
struct pending_identity final {
  std::optional<e164_t> phone_number;
  std::optional<uuid_t> aci;
  std::optional<uuid_t> pni;

  bool empty() const {
    return !phone_number.has_value() && !aci.has_value() && !pni.has_value();
  }

  bool operator==(const pending_identity&) const = default;
};

using pending_identity_t = pending_identity;

}  // namespace registrar::schema
