#pragma once

#include <registrar/schema/account_state.hpp>
#include <registrar/schema/local_address.hpp>
#include <registrar/schema/pending_identity.hpp>
#include <registrar/storage/key_value_store.hpp>
#include <registrar/storage/rocksdb/storage.hpp>

#include <memory>
#include <mutex>
#include <optional>

namespace registrar::account {

using storage_t =
    registrar::storage::storage<registrar::storage::rocksdb_storage_tag>;
using read_transaction_t =
    registrar::storage::read_transaction<registrar::storage::rocksdb_storage_tag>;
using write_transaction_t =
    registrar::storage::write_transaction<registrar::storage::rocksdb_storage_tag>;
using account_snapshot_t =
    std::shared_ptr<const registrar::schema::account_state_t>;

/// Build a snapshot from the account collection as seen by tx.
registrar::schema::account_state_t load_account_state(
    const registrar::storage::key_value_store& store,
    const read_transaction_t& tx);

/// Current account snapshot and the pending verification identity, both
/// guarded by one mutex so a reader never pairs a confirmed field with a
/// pending field from a different moment.
///
/// Lock ordering: the mutex is only ever taken inside a storage transaction
/// (one passed in, or one opened before locking). No storage transaction is
/// ever opened while the mutex is held.
///
/// Only committed state is installed: loads made on a cache miss use the
/// latest committed snapshot, and a write transaction that invalidated the
/// cache reloads it again if it rolls back.
class account_state_cache final {
 public:
  account_state_cache(storage_t& storage,
                      const registrar::storage::key_value_store& store);

  account_state_cache(const account_state_cache&) = delete;
  account_state_cache& operator=(const account_state_cache&) = delete;

  /// Cached snapshot; loads the latest committed state when nothing is
  /// cached yet. Must not be called from inside a write transaction.
  account_snapshot_t get_or_load();

  /// Cached snapshot, or the state as seen by tx when nothing is cached. A
  /// snapshot loaded through a write transaction is returned but not cached.
  account_snapshot_t get_or_load(const read_transaction_t& tx);

  /// Reload from tx and replace the cached snapshot. Every write that
  /// touches the account collection calls this before committing.
  account_snapshot_t invalidate(write_transaction_t& tx);

  /// Reload and clear the pending identity in one critical section. A
  /// rollback restores the cleared identity.
  account_snapshot_t invalidate_and_clear_pending(write_transaction_t& tx);

  /// Replace the cached snapshot with the latest committed state.
  account_snapshot_t reload();

  /// Load at start-up and log what was found.
  void warm();

  registrar::schema::pending_identity_t pending() const;
  void set_pending(registrar::schema::pending_identity_t pending);
  void clear_pending();

  std::optional<registrar::schema::e164_t> local_number();
  std::optional<registrar::schema::e164_t> local_number(
      const read_transaction_t& tx);
  std::optional<registrar::schema::uuid_t> local_aci();
  std::optional<registrar::schema::uuid_t> local_aci(
      const read_transaction_t& tx);
  std::optional<registrar::schema::uuid_t> local_pni();
  std::optional<registrar::schema::uuid_t> local_pni(
      const read_transaction_t& tx);

  /// ACI and number taken together under one lock, pending values first.
  std::optional<registrar::schema::local_address_t> local_address();

 private:
  struct view final {
    account_snapshot_t snapshot;
    registrar::schema::pending_identity_t pending;
  };

  view current_view();
  view current_view(const read_transaction_t& tx);
  account_snapshot_t load_locked(const read_transaction_t& tx);
  void did_roll_back(registrar::schema::pending_identity_t cleared);

  storage_t& storage_;
  const registrar::storage::key_value_store& store_;
  mutable std::mutex mutex_;
  account_snapshot_t cached_;
  registrar::schema::pending_identity_t pending_;
};

}  // namespace registrar::account
