#include <registrar/account/account_manager.hpp>
#include <registrar/common/critical.hpp>
#include <registrar/schema/key/account_keys.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string_view>
#include <type_traits>
#include <utility>

using namespace registrar::schema;

namespace registrar::account {

namespace {

template <typename T>
void log_transition(const std::string_view field,
                    const std::optional<T>& old_value,
                    const T& new_value) {
  if (old_value.has_value() && *old_value == new_value) {
    return;
  }
  if constexpr (std::is_same_v<T, uuid_t>) {
    spdlog::info("{}: {} -> {}", field, to_string(old_value),
                 to_string(new_value));
  } else {
    spdlog::info("{}: {} -> {}", field, old_value.value_or("<none>"),
                 new_value);
  }
}

}  // namespace

account_manager::account_manager(
    storage_t& storage,
    const registrar::storage::key_value_store& store,
    account_state_cache& cache,
    registrar::events::event_bus& bus,
    account_side_effects side_effects)
    : storage_{storage},
      store_{store},
      cache_{cache},
      bus_{bus},
      side_effects_{std::move(side_effects)} {}

template <typename Fn>
auto account_manager::perform_write(Fn&& fn) {
  try {
    return storage_.write(std::forward<Fn>(fn));
  } catch (const std::exception& ex) {
    spdlog::error("Account write failed: {}", ex.what());
    throw;
  }
}

void account_manager::post_after_commit(
    write_transaction_t& tx,
    registrar::events::account_event_t event) {
  tx.add_completion([this, event = std::move(event)] { bus_.post(event); });
}

account_snapshot_t account_manager::current_state() {
  return cache_.get_or_load();
}

account_snapshot_t account_manager::current_state(
    const read_transaction_t& tx) {
  return cache_.get_or_load(tx);
}

registration_state_t account_manager::registration_state() {
  return derive_registration_state(*current_state());
}

registration_state_t account_manager::registration_state(
    const read_transaction_t& tx) {
  return derive_registration_state(*current_state(tx));
}

bool account_manager::is_registered() {
  return registrar::schema::is_registered(*current_state());
}

bool account_manager::is_registered(const read_transaction_t& tx) {
  return registrar::schema::is_registered(*current_state(tx));
}

bool account_manager::is_registered_and_ready() {
  return registration_state() == registration_state_t::registered;
}

bool account_manager::is_registered_and_ready(const read_transaction_t& tx) {
  return registration_state(tx) == registration_state_t::registered;
}

bool account_manager::is_deregistered() {
  return is_logically_deregistered(*current_state());
}

bool account_manager::is_deregistered(const read_transaction_t& tx) {
  return is_logically_deregistered(*current_state(tx));
}

bool account_manager::is_reregistering() {
  return registrar::schema::is_reregistering(*current_state());
}

bool account_manager::is_reregistering(const read_transaction_t& tx) {
  return registrar::schema::is_reregistering(*current_state(tx));
}

bool account_manager::is_onboarded() {
  return current_state()->is_onboarded;
}

bool account_manager::is_onboarded(const read_transaction_t& tx) {
  return current_state(tx)->is_onboarded;
}

bool account_manager::is_transfer_in_progress() {
  return current_state()->is_transfer_in_progress;
}

bool account_manager::is_transfer_in_progress(const read_transaction_t& tx) {
  return current_state(tx)->is_transfer_in_progress;
}

bool account_manager::was_transferred() {
  return current_state()->was_transferred;
}

bool account_manager::was_transferred(const read_transaction_t& tx) {
  return current_state(tx)->was_transferred;
}

std::optional<e164_t> account_manager::reregistration_phone_number() {
  return current_state()->reregistration_phone_number;
}

std::optional<e164_t> account_manager::reregistration_phone_number(
    const read_transaction_t& tx) {
  return current_state(tx)->reregistration_phone_number;
}

std::optional<uuid_t> account_manager::reregistration_aci() {
  return current_state()->reregistration_aci;
}

std::optional<uuid_t> account_manager::reregistration_aci(
    const read_transaction_t& tx) {
  return current_state(tx)->reregistration_aci;
}

std::optional<timestamp_milliseconds_t> account_manager::registration_date() {
  return current_state()->registration_date;
}

std::optional<timestamp_milliseconds_t> account_manager::registration_date(
    const read_transaction_t& tx) {
  return current_state(tx)->registration_date;
}

device_id_t account_manager::stored_device_id() {
  return current_state()->device_id;
}

device_id_t account_manager::stored_device_id(const read_transaction_t& tx) {
  return current_state(tx)->device_id;
}

std::optional<std::string> account_manager::stored_server_auth_token() {
  return current_state()->server_auth_token;
}

std::optional<std::string> account_manager::stored_server_auth_token(
    const read_transaction_t& tx) {
  return current_state(tx)->server_auth_token;
}

// No longer set for new accounts.
std::optional<std::string> account_manager::stored_signaling_key() {
  return current_state()->server_signaling_key;
}

std::optional<std::string> account_manager::stored_device_name() {
  return current_state()->device_name;
}

std::optional<std::string> account_manager::stored_device_name(
    const read_transaction_t& tx) {
  return current_state(tx)->device_name;
}

std::optional<e164_t> account_manager::local_number() {
  return cache_.local_number();
}

std::optional<uuid_t> account_manager::local_aci() {
  return cache_.local_aci();
}

std::optional<uuid_t> account_manager::local_pni() {
  return cache_.local_pni();
}

std::optional<local_address_t> account_manager::local_address() {
  return cache_.local_address();
}

void account_manager::begin_verification(const e164_t& phone_number,
                                         const uuid_t& aci,
                                         const std::optional<uuid_t>& pni) {
  if (!is_structurally_valid_e164(phone_number)) {
    spdlog::warn("Verifying a number that is not valid E.164: {}",
                 phone_number);
  }
  cache_.set_pending(pending_identity_t{
      .phone_number = phone_number, .aci = aci, .pni = pni});
  bus_.post(registrar::events::local_identifiers_may_have_changed{});
}

void account_manager::store_local_identity(const e164_t& phone_number,
                                           const uuid_t& aci,
                                           const std::optional<uuid_t>& pni,
                                           write_transaction_t& tx) {
  if (aci.is_nil()) {
    registrar::common::critical("Missing local aci");
  }

  auto old_number = store_.get_string(key::kRegisteredNumberKey, tx);
  auto old_aci = store_.get_uuid(key::kRegisteredAciKey, tx);
  log_transition("local_number", old_number, phone_number);
  log_transition("local_aci", old_aci, aci);

  // The registration date marks when this identity was first confirmed.
  if (old_number != phone_number || old_aci != aci ||
      !store_.has_value(key::kRegistrationDateKey, tx)) {
    store_.set_date(key::kRegistrationDateKey, now_milliseconds(), tx);
  }
  store_.set_string(key::kRegisteredNumberKey, phone_number, tx);
  store_.set_uuid(key::kRegisteredAciKey, aci, tx);

  if (pni) {
    log_transition("local_pni", store_.get_uuid(key::kRegisteredPniKey, tx),
                   *pni);
    store_.set_uuid(key::kRegisteredPniKey, *pni, tx);
  }

  run_effect(side_effects_.update_address_mapping, aci, phone_number, tx);

  store_.remove_value(key::kIsDeregisteredKey, tx);
  store_.remove_value(key::kReregisteringPhoneNumberKey, tx);
  store_.remove_value(key::kReregisteringAciKey, tx);

  // Sender certificates embed the local number.
  run_effect(side_effects_.remove_sender_certificates, tx);
  run_effect(side_effects_.clear_should_share_phone_number, tx);
  run_effect(side_effects_.clear_profile_key_credentials, tx);
  run_effect(side_effects_.clear_group_temporal_credentials, tx);

  run_effect(side_effects_.mark_local_recipient_registered, aci, phone_number,
             tx);

  cache_.invalidate_and_clear_pending(tx);
}

void account_manager::did_register() {
  spdlog::info("Registration confirmed");
  auto pending = cache_.pending();
  if (!pending.phone_number) {
    registrar::common::critical("phone number was unexpectedly absent");
  }
  if (!pending.aci) {
    registrar::common::critical("aci was unexpectedly absent");
  }

  // The PNI may be absent.
  perform_write([&](write_transaction_t& tx) {
    store_local_identity(*pending.phone_number, *pending.aci, pending.pni, tx);
    post_after_commit(tx, registrar::events::registration_state_changed{});
  });
}

void account_manager::did_register_primary(const e164_t& e164,
                                           const uuid_t& aci,
                                           const std::optional<uuid_t>& pni,
                                           const std::string& auth_token,
                                           write_transaction_t& tx) {
  store_local_identity(e164, aci, pni, tx);
  set_stored_server_auth_token(auth_token, kPrimaryDeviceId, tx);
  post_after_commit(tx, registrar::events::registration_state_changed{});
}

void account_manager::update_local_phone_number(
    const e164_t& phone_number,
    const uuid_t& aci,
    const std::optional<uuid_t>& pni,
    const bool should_update_storage_service,
    write_transaction_t& tx) {
  if (!is_structurally_valid_e164(phone_number)) {
    spdlog::warn("Changing to a number that is not valid E.164: {}",
                 phone_number);
  }
  auto current_aci = cache_.get_or_load(tx)->local_aci;
  if (current_aci && *current_aci != aci) {
    spdlog::warn("Changing number for a different aci: {} -> {}",
                 to_string(*current_aci), to_string(aci));
  }

  store_local_identity(phone_number, aci, pni, tx);

  tx.add_completion([this, should_update_storage_service] {
    if (should_update_storage_service) {
      run_effect(side_effects_.record_pending_local_account_updates);
    }
    bus_.post(registrar::events::registration_state_changed{});
    bus_.post(registrar::events::local_identifiers_may_have_changed{});
  });
}

void account_manager::record_aci_for_legacy_user(const uuid_t& aci) {
  if (local_aci().has_value()) {
    registrar::common::critical("Legacy user already has an aci");
  }

  perform_write([&](write_transaction_t& tx) {
    store_.set_uuid(key::kRegisteredAciKey, aci, tx);
    cache_.invalidate(tx);
  });
}

void account_manager::set_stored_server_auth_token(const std::string& auth_token,
                                                   const device_id_t device_id,
                                                   write_transaction_t& tx) {
  store_.set_string(key::kServerAuthTokenKey, auth_token, tx);
  store_.set_uint32(key::kDeviceIdKey, device_id, tx);
  cache_.invalidate(tx);
}

void account_manager::set_stored_device_name(const std::string& device_name,
                                             write_transaction_t& tx) {
  store_.set_string(key::kDeviceNameKey, device_name, tx);
  cache_.invalidate(tx);
}

void account_manager::set_is_onboarded(const bool is_onboarded) {
  perform_write([&](write_transaction_t& tx) {
    set_is_onboarded(is_onboarded, tx);
  });
}

void account_manager::set_is_onboarded(const bool is_onboarded,
                                       write_transaction_t& tx) {
  store_.set_bool(key::kIsOnboardedKey, is_onboarded, tx);
  cache_.invalidate(tx);
  post_after_commit(tx, registrar::events::onboarding_state_changed{});
}

void account_manager::set_is_deregistered(const bool is_deregistered) {
  if (is_deregistered && !is_registered_and_ready()) {
    spdlog::info("Ignoring deregistration; not registered and ready");
    return;
  }
  if (current_state()->is_deregistered == is_deregistered) {
    spdlog::info("Skipping redundant is_deregistered write");
    return;
  }

  spdlog::warn("Updating is_deregistered: {}", is_deregistered);

  perform_write([&](write_transaction_t& tx) {
    // Another writer may have raced us between the check and this transaction.
    if (store_.get_bool(key::kIsDeregisteredKey, false, tx) ==
        is_deregistered) {
      return;
    }
    store_.set_bool(key::kIsDeregisteredKey, is_deregistered, tx);
    cache_.invalidate(tx);

    if (is_deregistered) {
      run_effect(side_effects_.notify_user_of_deregistration, tx);
    }
    post_after_commit(tx, registrar::events::registration_state_changed{});
  });
}

bool account_manager::reset_for_reregistration() {
  auto old_state = current_state();
  if (!old_state->local_number) {
    spdlog::error("Can't re-register without a valid local number");
    return false;
  }
  if (!old_state->local_aci) {
    spdlog::error("Can't re-register without a valid aci");
    return false;
  }
  auto local_number = *old_state->local_number;
  auto local_aci = *old_state->local_aci;
  auto was_primary_device = is_primary_device(*old_state);

  spdlog::info("Resetting for re-registration of {}", local_number);

  perform_write([&](write_transaction_t& tx) {
    store_.remove_all(tx);

    run_effect(side_effects_.reset_session_store, identity_kind_t::aci, tx);
    run_effect(side_effects_.reset_session_store, identity_kind_t::pni, tx);
    run_effect(side_effects_.reset_sender_key_store, tx);
    run_effect(side_effects_.remove_sender_certificates, tx);
    run_effect(side_effects_.clear_profile_key_credentials, tx);
    run_effect(side_effects_.clear_group_temporal_credentials, tx);

    store_.set_string(key::kReregisteringPhoneNumberKey, local_number, tx);
    store_.set_uuid(key::kReregisteringAciKey, local_aci, tx);
    store_.set_bool(key::kIsOnboardedKey, false, tx);

    if (was_primary_device) {
      spdlog::info("Keeping payments state on primary device");
    } else {
      run_effect(side_effects_.clear_payments_state, tx);
    }

    cache_.invalidate_and_clear_pending(tx);

    post_after_commit(tx, registrar::events::registration_state_changed{});
    post_after_commit(tx, registrar::events::onboarding_state_changed{});
  });

  return true;
}

void account_manager::set_is_transfer_in_progress(
    const bool transfer_in_progress) {
  if (transfer_in_progress == is_transfer_in_progress()) {
    spdlog::info("Skipping redundant is_transfer_in_progress write");
    return;
  }

  perform_write([&](write_transaction_t& tx) {
    store_.set_bool(key::kIsTransferInProgressKey, transfer_in_progress, tx);
    cache_.invalidate(tx);
    post_after_commit(tx, registrar::events::registration_state_changed{});
  });
}

void account_manager::set_was_transferred(const bool was_transferred) {
  perform_write([&](write_transaction_t& tx) {
    store_.set_bool(key::kWasTransferredKey, was_transferred, tx);
    cache_.invalidate(tx);
    post_after_commit(tx, registrar::events::registration_state_changed{});
  });
}

bool account_manager::is_manual_message_fetch_enabled() {
  return storage_.read([this](const read_transaction_t& tx) {
    return is_manual_message_fetch_enabled(tx);
  });
}

bool account_manager::is_manual_message_fetch_enabled(
    const read_transaction_t& tx) {
  return store_.get_bool(key::kManualMessageFetchKey, false, tx);
}

void account_manager::set_manual_message_fetch_enabled(const bool enabled) {
  perform_write([&](write_transaction_t& tx) {
    set_manual_message_fetch_enabled(enabled, tx);
  });
}

void account_manager::set_manual_message_fetch_enabled(
    const bool enabled,
    write_transaction_t& tx) {
  store_.set_bool(key::kManualMessageFetchKey, enabled, tx);
  cache_.invalidate(tx);
}

std::optional<bool> account_manager::is_discoverable_by_phone_number() {
  return current_state()->is_discoverable_by_phone_number;
}

void account_manager::set_is_discoverable_by_phone_number(
    const bool is_discoverable,
    write_transaction_t& tx) {
  store_.set_bool(key::kIsDiscoverableByPhoneNumberKey, is_discoverable, tx);
  store_.set_date(key::kLastSetIsDiscoverableByPhoneNumberKey,
                  now_milliseconds(), tx);
  cache_.invalidate(tx);
}

}  // namespace registrar::account
