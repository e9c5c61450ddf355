#include <registrar/common/critical.hpp>
#include <registrar/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace registrar::storage {

namespace detail {

std::vector<std::string> collect_keys(ROCKSDB_NAMESPACE::Iterator& iterator,
                                      const std::string_view& prefix) {
  auto keys = std::vector<std::string>{};
  iterator.Seek(to_slice(prefix));
  while (iterator.Valid()) {
    auto key_view =
        std::string_view{iterator.key().data(), iterator.key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    keys.emplace_back(key_view);
    iterator.Next();
  }
  if (!iterator.status().ok()) {
    spdlog::error("Failed iterating RocksDB keys: {}",
                  iterator.status().ToString());
    throw storage_error{"failed iterating keys"};
  }
  return keys;
}

void change_registry::append(database_change_delegate& delegate) {
  auto lock = std::scoped_lock{mutex_};
  delegates_.push_back(&delegate);
}

void change_registry::remove(database_change_delegate& delegate) {
  auto lock = std::scoped_lock{mutex_};
  std::erase(delegates_, &delegate);
}

}  // namespace detail

read_transaction<rocksdb_storage_tag>::read_transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database)
    : database_{database}, snapshot_{database.GetSnapshot()} {}

read_transaction<rocksdb_storage_tag>::read_transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database,
    no_snapshot_t)
    : database_{database} {}

read_transaction<rocksdb_storage_tag>::~read_transaction() {
  if (snapshot_ != nullptr) {
    database_.ReleaseSnapshot(snapshot_);
  }
}

std::optional<registrar::schema::bytes_t>
read_transaction<rocksdb_storage_tag>::get(const std::string_view& key) const {
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot_;
  auto value = std::string{};
  auto status = database_.Get(options, detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw storage_error{"failed to read value"};
  }
  return detail::to_bytes(value);
}

std::vector<std::string> read_transaction<rocksdb_storage_tag>::list_keys(
    const std::string_view& prefix) const {
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = snapshot_;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database_.NewIterator(options)};
  return detail::collect_keys(*iterator, prefix);
}

write_transaction<rocksdb_storage_tag>::write_transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database)
    : read_transaction<rocksdb_storage_tag>{database, no_snapshot_t{}},
      transaction_{database.BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})} {
  if (!transaction_) {
    registrar::common::critical("RocksDB failed to begin a transaction");
  }
}

write_transaction<rocksdb_storage_tag>::~write_transaction() {
  if (finished_) {
    return;
  }
  auto status = transaction_->Rollback();
  if (!status.ok()) {
    spdlog::error("Failed to roll back RocksDB transaction: {}",
                  status.ToString());
  } else {
    spdlog::warn("Rolled back uncommitted write transaction");
  }
}

std::optional<registrar::schema::bytes_t>
write_transaction<rocksdb_storage_tag>::get(const std::string_view& key) const {
  auto value = std::string{};
  auto status = transaction_->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                  detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB transaction: {}",
                  status.ToString());
    throw storage_error{"failed to read value"};
  }
  return detail::to_bytes(value);
}

std::vector<std::string> write_transaction<rocksdb_storage_tag>::list_keys(
    const std::string_view& prefix) const {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      transaction_->GetIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  return detail::collect_keys(*iterator, prefix);
}

void write_transaction<rocksdb_storage_tag>::put(
    const std::string_view& key,
    const registrar::schema::bytes_view_t& value) {
  auto status = transaction_->Put(detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw storage_error{"failed to write value"};
  }
}

void write_transaction<rocksdb_storage_tag>::remove(
    const std::string_view& key) {
  auto status = transaction_->Delete(detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}", status.ToString());
    throw storage_error{"failed to delete value"};
  }
}

void write_transaction<rocksdb_storage_tag>::add_completion(
    std::function<void()> completion) {
  completions_.push_back(std::move(completion));
}

void write_transaction<rocksdb_storage_tag>::add_rollback_handler(
    std::function<void()> handler) {
  rollback_handlers_.push_back(std::move(handler));
}

void write_transaction<rocksdb_storage_tag>::commit() {
  if (finished_) {
    registrar::common::critical("write transaction already finished");
  }
  auto status = transaction_->Commit();
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB transaction: {}",
                  status.ToString());
    throw storage_error{"failed to commit transaction"};
  }
  finished_ = true;
  rollback_handlers_.clear();
}

std::vector<std::function<void()>>
write_transaction<rocksdb_storage_tag>::take_completions() {
  return std::exchange(completions_, {});
}

std::vector<std::function<void()>>
write_transaction<rocksdb_storage_tag>::take_rollback_handlers() {
  completions_.clear();
  return std::exchange(rollback_handlers_, {});
}

void storage<rocksdb_storage_tag>::append_change_delegate(
    database_change_delegate& delegate) {
  changes->append(delegate);
}

void storage<rocksdb_storage_tag>::remove_change_delegate(
    database_change_delegate& delegate) {
  changes->remove(delegate);
}

void storage<rocksdb_storage_tag>::notify_changed_externally() const {
  spdlog::debug("Database changed externally");
  changes->for_each([](database_change_delegate& delegate) {
    delegate.database_changes_did_update_externally();
  });
}

void storage<rocksdb_storage_tag>::notify_reset() const {
  changes->for_each([](database_change_delegate& delegate) {
    delegate.database_changes_did_reset();
  });
}

void storage<rocksdb_storage_tag>::did_commit(
    std::vector<std::function<void()>>& completions) const {
  for (auto& completion : completions) {
    completion();
  }
  changes->for_each([](database_change_delegate& delegate) {
    delegate.database_changes_did_update();
  });
}

void storage<rocksdb_storage_tag>::did_roll_back(
    std::vector<std::function<void()>>& handlers) const {
  spdlog::debug("Running {} rollback handler(s)", handlers.size());
  for (auto& handler : handlers) {
    handler();
  }
}

namespace {

storage<rocksdb_storage_tag> open_storage(
    std::unique_ptr<ROCKSDB_NAMESPACE::Env> env,
    const std::string& path) {
  auto store = storage<rocksdb_storage_tag>{};
  store.env = std::move(env);

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  if (store.env) {
    options.env = store.env.get();
  } else {
    options.IncreaseParallelism();
    options.OptimizeLevelStyleCompaction();
  }

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, ROCKSDB_NAMESPACE::TransactionDBOptions{}, path, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    registrar::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  return open_storage(nullptr, std::string{path});
}

template <>
storage<rocksdb_storage_tag> make_in_memory_storage<rocksdb_storage_tag>(
    const std::string_view& name) {
  auto env = std::unique_ptr<ROCKSDB_NAMESPACE::Env>{
      ROCKSDB_NAMESPACE::NewMemEnv(ROCKSDB_NAMESPACE::Env::Default())};
  return open_storage(std::move(env), "/" + std::string{name});
}

}  // namespace registrar::storage
