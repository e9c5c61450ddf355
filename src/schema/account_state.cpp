#include <registrar/schema/account_state.hpp>

#include <spdlog/spdlog.h>

namespace registrar::schema {

bool is_registered(const account_state_t& state) {
  return state.local_number.has_value();
}

bool is_logically_deregistered(const account_state_t& state) {
  // An in-progress transfer is treated as being deregistered.
  return state.is_transfer_in_progress || state.was_transferred ||
         state.is_deregistered;
}

bool is_reregistering(const account_state_t& state) {
  return state.reregistration_phone_number.has_value();
}

bool is_primary_device(const account_state_t& state) {
  return state.device_id == kPrimaryDeviceId;
}

registration_state_t derive_registration_state(const account_state_t& state) {
  if (!is_registered(state)) {
    return registration_state_t::unregistered;
  }
  if (state.is_deregistered && is_reregistering(state)) {
    return registration_state_t::reregistering;
  }
  if (is_logically_deregistered(state)) {
    return registration_state_t::deregistered;
  }
  return registration_state_t::registered;
}

void log(const account_state_t& state) {
  spdlog::debug("local_number: {}", state.local_number.value_or("<none>"));
  spdlog::debug("local_aci: {}", to_string(state.local_aci));
  spdlog::debug("local_pni: {}", to_string(state.local_pni));
  spdlog::debug("registration_date: {}", state.registration_date.value_or(0));
  spdlog::debug("is_onboarded: {}", state.is_onboarded);
  spdlog::debug("is_deregistered: {}", state.is_deregistered);
  spdlog::debug("is_transfer_in_progress: {}", state.is_transfer_in_progress);
  spdlog::debug("was_transferred: {}", state.was_transferred);
  spdlog::debug("reregistration_phone_number: {}",
                state.reregistration_phone_number.value_or("<none>"));
  spdlog::debug("reregistration_aci: {}", to_string(state.reregistration_aci));
  spdlog::debug("device_id: {}", state.device_id);
  spdlog::debug("registration_state: {}",
                to_string(derive_registration_state(state)));
}

}  // namespace registrar::schema
