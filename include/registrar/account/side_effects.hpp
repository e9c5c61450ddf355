#pragma once

#include <registrar/schema/identity_kind.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/storage/rocksdb/storage.hpp>

#include <functional>

namespace registrar::account {

using write_transaction_t =
    registrar::storage::write_transaction<registrar::storage::rocksdb_storage_tag>;

using transaction_effect_t = std::function<void(write_transaction_t&)>;
using session_store_effect_t =
    std::function<void(registrar::schema::identity_kind_t, write_transaction_t&)>;
using identity_effect_t =
    std::function<void(const registrar::schema::uuid_t& aci,
                       const registrar::schema::e164_t& phone_number,
                       write_transaction_t&)>;

/// Dependent subsystems the registration state machine drives during a
/// transition. Every effect runs inside the transition's write transaction;
/// `record_pending_local_account_updates` alone runs after commit.
///
/// Unset members are skipped.
struct account_side_effects final {
  /// Sender certificates are bound to the local number.
  transaction_effect_t remove_sender_certificates;
  transaction_effect_t clear_should_share_phone_number;
  transaction_effect_t clear_profile_key_credentials;
  transaction_effect_t clear_group_temporal_credentials;
  session_store_effect_t reset_session_store;
  transaction_effect_t reset_sender_key_store;
  transaction_effect_t clear_payments_state;
  /// Address cache mapping between the local ACI and phone number.
  identity_effect_t update_address_mapping;
  identity_effect_t mark_local_recipient_registered;
  /// User-facing notice; atomic with the deregistered flag.
  transaction_effect_t notify_user_of_deregistration;
  std::function<void()> record_pending_local_account_updates;
};

}  // namespace registrar::account
