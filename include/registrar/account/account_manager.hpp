#pragma once

#include <registrar/account/account_state_cache.hpp>
#include <registrar/account/side_effects.hpp>
#include <registrar/events/event_bus.hpp>
#include <registrar/schema/account_state.hpp>
#include <registrar/schema/local_address.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/schema/registration_state.hpp>
#include <registrar/storage/key_value_store.hpp>

#include <optional>
#include <string>

namespace registrar::account {

/// Registration state machine for the local device.
///
/// Every transition runs in a single storage write transaction, drives the
/// dependent subsystems in `account_side_effects` inside it, and reloads the
/// account cache before the transaction commits. Events are posted to the
/// bus only after commit.
///
/// Overloads without a transaction parameter open their own. Overloads that
/// take one must be called with a transaction the caller opened; they never
/// open another.
class account_manager final {
 public:
  account_manager(storage_t& storage,
                  const registrar::storage::key_value_store& store,
                  account_state_cache& cache,
                  registrar::events::event_bus& bus,
                  account_side_effects side_effects = {});

  account_manager(const account_manager&) = delete;
  account_manager& operator=(const account_manager&) = delete;

  /// Snapshot accessors.
  account_snapshot_t current_state();
  account_snapshot_t current_state(const read_transaction_t& tx);

  registrar::schema::registration_state_t registration_state();
  registrar::schema::registration_state_t registration_state(
      const read_transaction_t& tx);
  bool is_registered();
  bool is_registered(const read_transaction_t& tx);
  bool is_registered_and_ready();
  bool is_registered_and_ready(const read_transaction_t& tx);
  bool is_deregistered();
  bool is_deregistered(const read_transaction_t& tx);
  bool is_reregistering();
  bool is_reregistering(const read_transaction_t& tx);
  bool is_onboarded();
  bool is_onboarded(const read_transaction_t& tx);
  bool is_transfer_in_progress();
  bool is_transfer_in_progress(const read_transaction_t& tx);
  bool was_transferred();
  bool was_transferred(const read_transaction_t& tx);

  std::optional<registrar::schema::e164_t> reregistration_phone_number();
  std::optional<registrar::schema::e164_t> reregistration_phone_number(
      const read_transaction_t& tx);
  std::optional<registrar::schema::uuid_t> reregistration_aci();
  std::optional<registrar::schema::uuid_t> reregistration_aci(
      const read_transaction_t& tx);
  std::optional<registrar::schema::timestamp_milliseconds_t>
  registration_date();
  std::optional<registrar::schema::timestamp_milliseconds_t> registration_date(
      const read_transaction_t& tx);
  registrar::schema::device_id_t stored_device_id();
  registrar::schema::device_id_t stored_device_id(const read_transaction_t& tx);
  std::optional<std::string> stored_server_auth_token();
  std::optional<std::string> stored_server_auth_token(
      const read_transaction_t& tx);
  std::optional<std::string> stored_signaling_key();
  std::optional<std::string> stored_device_name();
  std::optional<std::string> stored_device_name(const read_transaction_t& tx);

  /// Local identifiers, with a pending verification taking precedence.
  std::optional<registrar::schema::e164_t> local_number();
  std::optional<registrar::schema::uuid_t> local_aci();
  std::optional<registrar::schema::uuid_t> local_pni();
  std::optional<registrar::schema::local_address_t> local_address();

  /// Start a verification attempt. In-memory only.
  void begin_verification(
      const registrar::schema::e164_t& phone_number,
      const registrar::schema::uuid_t& aci,
      const std::optional<registrar::schema::uuid_t>& pni);

  /// Confirm the local identity. `aci` must not be nil; `pni` may be absent,
  /// in which case any stored PNI is kept.
  void store_local_identity(const registrar::schema::e164_t& phone_number,
                            const registrar::schema::uuid_t& aci,
                            const std::optional<registrar::schema::uuid_t>& pni,
                            write_transaction_t& tx);

  /// Confirm the identity captured by `begin_verification`.
  void did_register();

  /// Confirm a primary-device registration and store its credentials.
  void did_register_primary(const registrar::schema::e164_t& e164,
                            const registrar::schema::uuid_t& aci,
                            const std::optional<registrar::schema::uuid_t>& pni,
                            const std::string& auth_token,
                            write_transaction_t& tx);

  /// Change-number flow: confirm the new number for the existing ACI.
  void update_local_phone_number(
      const registrar::schema::e164_t& phone_number,
      const registrar::schema::uuid_t& aci,
      const std::optional<registrar::schema::uuid_t>& pni,
      bool should_update_storage_service,
      write_transaction_t& tx);

  /// Store an ACI for an account registered before ACIs existed.
  void record_aci_for_legacy_user(const registrar::schema::uuid_t& aci);

  void set_stored_server_auth_token(const std::string& auth_token,
                                    registrar::schema::device_id_t device_id,
                                    write_transaction_t& tx);
  void set_stored_device_name(const std::string& device_name,
                              write_transaction_t& tx);

  void set_is_onboarded(bool is_onboarded);
  void set_is_onboarded(bool is_onboarded, write_transaction_t& tx);

  /// Ignored when marking an account that is not registered and ready, and
  /// when the value is unchanged.
  void set_is_deregistered(bool is_deregistered);

  /// Wipe the account collection and keep the old number and ACI for the
  /// next registration. Returns false, changing nothing, when there is no
  /// confirmed number or ACI to keep.
  bool reset_for_reregistration();

  void set_is_transfer_in_progress(bool transfer_in_progress);
  void set_was_transferred(bool was_transferred);

  bool is_manual_message_fetch_enabled();
  bool is_manual_message_fetch_enabled(const read_transaction_t& tx);
  void set_manual_message_fetch_enabled(bool enabled);
  void set_manual_message_fetch_enabled(bool enabled, write_transaction_t& tx);

  std::optional<bool> is_discoverable_by_phone_number();
  void set_is_discoverable_by_phone_number(bool is_discoverable,
                                           write_transaction_t& tx);

 private:
  /// Runs fn in a write transaction and logs a failure before rethrowing.
  template <typename Fn>
  auto perform_write(Fn&& fn);

  void post_after_commit(write_transaction_t& tx,
                         registrar::events::account_event_t event);

  template <typename Fn, typename... Args>
  void run_effect(const Fn& effect, Args&&... args) const;

  storage_t& storage_;
  const registrar::storage::key_value_store& store_;
  account_state_cache& cache_;
  registrar::events::event_bus& bus_;
  account_side_effects side_effects_;
};

template <typename Fn, typename... Args>
void account_manager::run_effect(const Fn& effect, Args&&... args) const {
  if (effect) {
    effect(std::forward<Args>(args)...);
  }
}

}  // namespace registrar::account
