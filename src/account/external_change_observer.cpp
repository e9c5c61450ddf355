#include <registrar/account/external_change_observer.hpp>

#include <spdlog/spdlog.h>

namespace registrar::account {

external_change_observer::external_change_observer(account_state_cache& cache)
    : cache_{cache} {}

// In-process writes already reload the cache inside their transaction.
void external_change_observer::database_changes_did_update() {}

void external_change_observer::database_changes_did_update_externally() {
  spdlog::debug("Reloading account state after external database change");
  cache_.reload();
}

void external_change_observer::database_changes_did_reset() {}

}  // namespace registrar::account
