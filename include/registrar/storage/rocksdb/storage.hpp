#pragma once
#include <rocksdb/env.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>
#include <registrar/schema/primitives.hpp>
#include <registrar/common/critical.hpp>
#include <registrar/storage/storage.hpp>
#include <functional>
#include <memory>
#include <exception>
#include <mutex>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace registrar::storage {

struct rocksdb_storage_tag {};

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(const std::string_view& value) {
  return ROCKSDB_NAMESPACE::Slice{value.data(), value.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const registrar::schema::bytes_view_t& value) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(value.data()),
                                  value.size()};
}

inline registrar::schema::bytes_t to_bytes(const std::string& value) {
  return registrar::schema::make_bytes(value);
}

/// Collects keys under prefix from an already positioned iterator.
std::vector<std::string> collect_keys(ROCKSDB_NAMESPACE::Iterator& iterator,
                                      const std::string_view& prefix);

/// Delegates registered against one storage instance.
class change_registry final {
 public:
  void append(database_change_delegate& delegate);
  void remove(database_change_delegate& delegate);

  template <typename Fn>
  void for_each(Fn&& fn) const {
    // Held for the whole dispatch so removal waits for in-flight callbacks.
    auto lock = std::scoped_lock{mutex_};
    for (auto* delegate : delegates_) {
      fn(*delegate);
    }
  }

 private:
  mutable std::mutex mutex_;
  std::vector<database_change_delegate*> delegates_;
};

}  // namespace detail

template <>
class read_transaction<rocksdb_storage_tag> {
 public:
  explicit read_transaction(ROCKSDB_NAMESPACE::TransactionDB& database);
  virtual ~read_transaction();

  read_transaction(const read_transaction&) = delete;
  read_transaction& operator=(const read_transaction&) = delete;
  read_transaction(read_transaction&&) = delete;
  read_transaction& operator=(read_transaction&&) = delete;

  virtual std::optional<registrar::schema::bytes_t> get(
      const std::string_view& key) const;
  virtual std::vector<std::string> list_keys(
      const std::string_view& prefix) const;

 protected:
  struct no_snapshot_t {};
  read_transaction(ROCKSDB_NAMESPACE::TransactionDB& database, no_snapshot_t);

  ROCKSDB_NAMESPACE::TransactionDB& database_;

 private:
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
};

template <>
class write_transaction<rocksdb_storage_tag> final
    : public read_transaction<rocksdb_storage_tag> {
 public:
  explicit write_transaction(ROCKSDB_NAMESPACE::TransactionDB& database);
  ~write_transaction() override;

  std::optional<registrar::schema::bytes_t> get(
      const std::string_view& key) const override;
  std::vector<std::string> list_keys(
      const std::string_view& prefix) const override;

  void put(const std::string_view& key,
           const registrar::schema::bytes_view_t& value);
  void remove(const std::string_view& key);

  /// Queue work to run on the committing thread once the commit succeeded
  /// and the write lock is released. Dropped on rollback.
  void add_completion(std::function<void()> completion);

  /// Queue work to run once the transaction rolled back and the write lock
  /// is released. Dropped on commit.
  void add_rollback_handler(std::function<void()> handler);

  void commit();
  bool finished() const { return finished_; }

  std::vector<std::function<void()>> take_completions();
  std::vector<std::function<void()>> take_rollback_handlers();

 private:
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> transaction_;
  std::vector<std::function<void()>> completions_;
  std::vector<std::function<void()>> rollback_handlers_;
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  using read_transaction_t = read_transaction<rocksdb_storage_tag>;
  using write_transaction_t = write_transaction<rocksdb_storage_tag>;

  // Declared before `database` so an in-memory env outlives the DB.
  std::unique_ptr<ROCKSDB_NAMESPACE::Env> env;
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  std::unique_ptr<std::mutex> write_mutex{std::make_unique<std::mutex>()};
  std::unique_ptr<detail::change_registry> changes{
      std::make_unique<detail::change_registry>()};

  template <typename Fn>
  auto read(Fn&& fn) const;

  /// Like `read`, but the snapshot is taken and fn runs while no write
  /// transaction of this process is open. Must not be called from inside a
  /// write transaction.
  template <typename Fn>
  auto read_latest(Fn&& fn) const;

  template <typename Fn>
  auto write(Fn&& fn);

  void append_change_delegate(database_change_delegate& delegate);
  void remove_change_delegate(database_change_delegate& delegate);
  /// Delegates run on the calling thread and may read the latest state, so
  /// neither may be called from inside a write transaction.
  void notify_changed_externally() const;
  void notify_reset() const;

 private:
  void did_commit(std::vector<std::function<void()>>& completions) const;
  void did_roll_back(std::vector<std::function<void()>>& handlers) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <>
storage<rocksdb_storage_tag> make_in_memory_storage<rocksdb_storage_tag>(
    const std::string_view& name);

template <typename Fn>
auto storage<rocksdb_storage_tag>::read(Fn&& fn) const {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  auto transaction = read_transaction_t{*database};
  return std::invoke(std::forward<Fn>(fn),
                     static_cast<const read_transaction_t&>(transaction));
}

template <typename Fn>
auto storage<rocksdb_storage_tag>::read_latest(Fn&& fn) const {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  auto lock = std::scoped_lock{*write_mutex};
  auto transaction = read_transaction_t{*database};
  return std::invoke(std::forward<Fn>(fn),
                     static_cast<const read_transaction_t&>(transaction));
}

template <typename Fn>
auto storage<rocksdb_storage_tag>::write(Fn&& fn) {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  using result_t = std::invoke_result_t<Fn, write_transaction_t&>;
  auto completions = std::vector<std::function<void()>>{};
  auto rollback_handlers = std::vector<std::function<void()>>{};
  // The transaction rolls back when it is destroyed unfinished; its handlers
  // run after the write lock is released.
  auto run = [&] {
    auto lock = std::scoped_lock{*write_mutex};
    auto transaction = write_transaction_t{*database};
    try {
      if constexpr (std::is_void_v<result_t>) {
        std::invoke(std::forward<Fn>(fn), transaction);
        transaction.commit();
        completions = transaction.take_completions();
      } else {
        auto value = std::invoke(std::forward<Fn>(fn), transaction);
        transaction.commit();
        completions = transaction.take_completions();
        return value;
      }
    } catch (const std::exception&) {
      rollback_handlers = transaction.take_rollback_handlers();
      throw;
    }
  };
  try {
    if constexpr (std::is_void_v<result_t>) {
      run();
      did_commit(completions);
    } else {
      auto result = run();
      did_commit(completions);
      return result;
    }
  } catch (const std::exception&) {
    if (!rollback_handlers.empty()) {
      did_roll_back(rollback_handlers);
    }
    throw;
  }
}

}  // namespace registrar::storage
