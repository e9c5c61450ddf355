#pragma once

#include <registrar/account/account_state_cache.hpp>
#include <registrar/storage/storage.hpp>

namespace registrar::account {

/// Keeps a secondary process's account cache in step with writes committed
/// by the main process. Any external write may be a deregistration, so the
/// whole snapshot is reloaded.
class external_change_observer final
    : public registrar::storage::database_change_delegate {
 public:
  explicit external_change_observer(account_state_cache& cache);

  void database_changes_did_update() override;
  void database_changes_did_update_externally() override;
  void database_changes_did_reset() override;

 private:
  account_state_cache& cache_;
};

}  // namespace registrar::account
