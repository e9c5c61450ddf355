#pragma once
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/registration_state.hpp>
#include <optional>
#include <string>

namespace registrar::schema {

template <uint16_t Version> struct account_state;

/// Immutable view of every persisted account field at one point in time.
///
/// A default-constructed snapshot describes a device that never registered.
template <> struct account_state<1> final {
  std::optional<e164_t> local_number;
  std::optional<uuid_t> local_aci;
  std::optional<uuid_t> local_pni;
  std::optional<timestamp_milliseconds_t> registration_date;
  bool is_onboarded{false};
  bool is_deregistered{false};
  bool is_transfer_in_progress{false};
  bool was_transferred{false};
  std::optional<e164_t> reregistration_phone_number;
  std::optional<uuid_t> reregistration_aci;
  std::optional<std::string> server_auth_token;
  std::optional<std::string> server_signaling_key;
  device_id_t device_id{kPrimaryDeviceId};
  std::optional<std::string> device_name;
  bool manual_message_fetch_enabled{false};
  std::optional<bool> is_discoverable_by_phone_number;
  std::optional<timestamp_milliseconds_t>
      last_set_is_discoverable_by_phone_number;

  bool operator==(const account_state<1>&) const = default;
};

using account_state_t = account_state<1>;

/// A confirmed number is only ever written together with its ACI.
bool is_registered(const account_state_t& state);

/// Transfer in progress, completed transfer, or explicit deregistration.
bool is_logically_deregistered(const account_state_t& state);

bool is_reregistering(const account_state_t& state);

bool is_primary_device(const account_state_t& state);

registration_state_t derive_registration_state(const account_state_t& state);

/// Log the snapshot at debug level.
void log(const account_state_t& state);

}  // namespace registrar::schema
