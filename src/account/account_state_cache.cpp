#include <registrar/account/account_state_cache.hpp>
#include <registrar/schema/key/account_keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace registrar::schema;

namespace registrar::account {

account_state_t load_account_state(
    const registrar::storage::key_value_store& store,
    const read_transaction_t& tx) {
  auto state = account_state_t{};
  state.local_number = store.get_string(key::kRegisteredNumberKey, tx);
  state.local_aci = store.get_uuid(key::kRegisteredAciKey, tx);
  state.local_pni = store.get_uuid(key::kRegisteredPniKey, tx);
  state.registration_date = store.get_date(key::kRegistrationDateKey, tx);
  state.is_onboarded = store.get_bool(key::kIsOnboardedKey, false, tx);
  state.is_deregistered = store.get_bool(key::kIsDeregisteredKey, false, tx);
  state.is_transfer_in_progress =
      store.get_bool(key::kIsTransferInProgressKey, false, tx);
  state.was_transferred = store.get_bool(key::kWasTransferredKey, false, tx);
  state.reregistration_phone_number =
      store.get_string(key::kReregisteringPhoneNumberKey, tx);
  state.reregistration_aci = store.get_uuid(key::kReregisteringAciKey, tx);
  state.server_auth_token = store.get_string(key::kServerAuthTokenKey, tx);
  state.server_signaling_key = store.get_string(key::kServerSignalingKey, tx);
  state.device_id =
      store.get_uint32(key::kDeviceIdKey, tx).value_or(kPrimaryDeviceId);
  state.device_name = store.get_string(key::kDeviceNameKey, tx);
  state.manual_message_fetch_enabled =
      store.get_bool(key::kManualMessageFetchKey, false, tx);
  state.is_discoverable_by_phone_number =
      store.get_optional_bool(key::kIsDiscoverableByPhoneNumberKey, tx);
  state.last_set_is_discoverable_by_phone_number =
      store.get_date(key::kLastSetIsDiscoverableByPhoneNumberKey, tx);
  return state;
}

account_state_cache::account_state_cache(
    storage_t& storage,
    const registrar::storage::key_value_store& store)
    : storage_{storage}, store_{store} {}

account_snapshot_t account_state_cache::load_locked(
    const read_transaction_t& tx) {
  cached_ = std::make_shared<const account_state_t>(load_account_state(store_, tx));
  return cached_;
}

account_snapshot_t account_state_cache::get_or_load() {
  {
    auto lock = std::scoped_lock{mutex_};
    if (cached_) {
      return cached_;
    }
  }
  return storage_.read_latest([this](const read_transaction_t& tx) {
    auto lock = std::scoped_lock{mutex_};
    // Another thread may have filled the cache while we waited.
    if (cached_) {
      return cached_;
    }
    return load_locked(tx);
  });
}

account_snapshot_t account_state_cache::get_or_load(
    const read_transaction_t& tx) {
  // Uncommitted state is only cached through invalidate, which can undo it.
  if (dynamic_cast<const write_transaction_t*>(&tx) != nullptr) {
    {
      auto lock = std::scoped_lock{mutex_};
      if (cached_) {
        return cached_;
      }
    }
    return std::make_shared<const account_state_t>(
        load_account_state(store_, tx));
  }
  auto lock = std::scoped_lock{mutex_};
  if (cached_) {
    return cached_;
  }
  return load_locked(tx);
}

account_snapshot_t account_state_cache::invalidate(write_transaction_t& tx) {
  tx.add_rollback_handler([this] { did_roll_back({}); });
  auto lock = std::scoped_lock{mutex_};
  return load_locked(tx);
}

account_snapshot_t account_state_cache::invalidate_and_clear_pending(
    write_transaction_t& tx) {
  auto lock = std::scoped_lock{mutex_};
  auto cleared = std::exchange(pending_, pending_identity_t{});
  tx.add_rollback_handler(
      [this, cleared = std::move(cleared)] { did_roll_back(cleared); });
  return load_locked(tx);
}

account_snapshot_t account_state_cache::reload() {
  // The write lock keeps an in-process writer from committing between the
  // snapshot and its installation.
  return storage_.read_latest([this](const read_transaction_t& tx) {
    auto lock = std::scoped_lock{mutex_};
    return load_locked(tx);
  });
}

void account_state_cache::did_roll_back(pending_identity_t cleared) {
  {
    auto lock = std::scoped_lock{mutex_};
    // A verification begun after the rollback wins.
    if (!cleared.empty() && pending_.empty()) {
      pending_ = std::move(cleared);
    }
  }
  spdlog::warn("Account write rolled back, reloading committed state");
  reload();
}

void account_state_cache::warm() {
  auto snapshot = reload();
  spdlog::info("Account state loaded: {}",
               registrar::schema::to_string(derive_registration_state(*snapshot)));
  registrar::schema::log(*snapshot);
}

pending_identity_t account_state_cache::pending() const {
  auto lock = std::scoped_lock{mutex_};
  return pending_;
}

void account_state_cache::set_pending(pending_identity_t pending) {
  auto lock = std::scoped_lock{mutex_};
  pending_ = std::move(pending);
}

void account_state_cache::clear_pending() {
  auto lock = std::scoped_lock{mutex_};
  pending_ = pending_identity_t{};
}

account_state_cache::view account_state_cache::current_view() {
  auto snapshot = get_or_load();
  auto lock = std::scoped_lock{mutex_};
  return view{cached_ ? cached_ : snapshot, pending_};
}

account_state_cache::view account_state_cache::current_view(
    const read_transaction_t& tx) {
  auto snapshot = get_or_load(tx);
  auto lock = std::scoped_lock{mutex_};
  return view{cached_ ? cached_ : snapshot, pending_};
}

std::optional<e164_t> account_state_cache::local_number() {
  auto current = current_view();
  if (current.pending.phone_number) {
    return current.pending.phone_number;
  }
  return current.snapshot->local_number;
}

std::optional<e164_t> account_state_cache::local_number(
    const read_transaction_t& tx) {
  auto current = current_view(tx);
  if (current.pending.phone_number) {
    return current.pending.phone_number;
  }
  return current.snapshot->local_number;
}

std::optional<uuid_t> account_state_cache::local_aci() {
  auto current = current_view();
  if (current.pending.aci) {
    return current.pending.aci;
  }
  return current.snapshot->local_aci;
}

std::optional<uuid_t> account_state_cache::local_aci(
    const read_transaction_t& tx) {
  auto current = current_view(tx);
  if (current.pending.aci) {
    return current.pending.aci;
  }
  return current.snapshot->local_aci;
}

std::optional<uuid_t> account_state_cache::local_pni() {
  auto current = current_view();
  if (current.pending.pni) {
    return current.pending.pni;
  }
  return current.snapshot->local_pni;
}

std::optional<uuid_t> account_state_cache::local_pni(
    const read_transaction_t& tx) {
  auto current = current_view(tx);
  if (current.pending.pni) {
    return current.pending.pni;
  }
  return current.snapshot->local_pni;
}

std::optional<local_address_t> account_state_cache::local_address() {
  auto current = current_view();
  auto address = local_address_t{
      .aci = current.pending.aci ? current.pending.aci
                                 : current.snapshot->local_aci,
      .phone_number = current.pending.phone_number
                          ? current.pending.phone_number
                          : current.snapshot->local_number};
  if (!address.aci && !address.phone_number) {
    return std::nullopt;
  }
  return address;
}

}  // namespace registrar::account
