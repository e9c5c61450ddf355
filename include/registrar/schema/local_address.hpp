#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>

namespace registrar::schema {

/// The local user's (aci, phone number) pair, read from one snapshot.
struct local_address final {
  std::optional<uuid_t> aci;
  std::optional<e164_t> phone_number;

  bool operator==(const local_address&) const = default;
};

using local_address_t = local_address;

}  // namespace registrar::schema
