#pragma once

#include <registrar/account/account_manager.hpp>
#include <registrar/account/account_state_cache.hpp>
#include <registrar/account/external_change_observer.hpp>
#include <registrar/account/side_effects.hpp>
#include <registrar/events/event_bus.hpp>
#include <registrar/storage/key_value_store.hpp>
#include <registrar/storage/rocksdb/storage.hpp>

#include <memory>
#include <string>

namespace registrar::app {

struct environment_options final {
  std::string db_path{"registrar.db"};
  /// Keep the database in memory; `db_path` then only names it.
  bool in_memory{false};
  /// Secondary processes watch for writes made by the main app.
  bool is_main_app{true};
};

/// Owns the account subsystem for the lifetime of the application.
///
/// Construction opens storage and warms the account cache; destruction
/// detaches the external change observer and drains pending events before
/// anything is torn down.
class environment final {
 public:
  explicit environment(environment_options options,
                       registrar::account::account_side_effects side_effects = {});
  ~environment();

  environment(const environment&) = delete;
  environment& operator=(const environment&) = delete;

  const environment_options& options() const { return options_; }

  registrar::account::storage_t& storage() { return storage_; }
  registrar::events::event_bus& bus() { return bus_; }
  registrar::account::account_state_cache& cache() { return cache_; }
  registrar::account::account_manager& accounts() { return accounts_; }

  /// Forward a cross-process "database changed" signal.
  void database_changed_externally();

 private:
  environment_options options_;
  registrar::account::storage_t storage_;
  registrar::storage::key_value_store account_store_;
  registrar::events::event_bus bus_;
  registrar::account::account_state_cache cache_;
  registrar::account::account_manager accounts_;
  std::unique_ptr<registrar::account::external_change_observer> observer_;
};

}  // namespace registrar::app
