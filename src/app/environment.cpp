#include <registrar/app/environment.hpp>
#include <registrar/schema/key/account_keys.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace registrar::app {

namespace {

registrar::account::storage_t open_storage(const environment_options& options) {
  if (options.in_memory) {
    return registrar::storage::make_in_memory_storage<
        registrar::storage::rocksdb_storage_tag>(options.db_path);
  }
  return registrar::storage::make_storage<
      registrar::storage::rocksdb_storage_tag>(options.db_path);
}

}  // namespace

environment::environment(environment_options options,
                         registrar::account::account_side_effects side_effects)
    : options_{std::move(options)},
      storage_{open_storage(options_)},
      account_store_{registrar::schema::key::kUserAccountCollection},
      bus_{},
      cache_{storage_, account_store_},
      accounts_{storage_, account_store_, cache_, bus_,
                std::move(side_effects)} {
  if (!options_.is_main_app) {
    observer_ =
        std::make_unique<registrar::account::external_change_observer>(cache_);
    storage_.append_change_delegate(*observer_);
    spdlog::info("Watching for external database changes");
  }
  cache_.warm();
}

environment::~environment() {
  if (observer_) {
    storage_.remove_change_delegate(*observer_);
  }
  bus_.flush();
}

void environment::database_changed_externally() {
  storage_.notify_changed_externally();
}

}  // namespace registrar::app
