#pragma once
#include <registrar/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::storage {

/// Raised when the backend fails a read, write or commit. A write
/// transaction that sees this rolls back.
class storage_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Observer of committed changes to the database.
///
/// `database_changes_did_update` fires after a write committed by this
/// process. `database_changes_did_update_externally` fires when another
/// process sharing the same database committed, and
/// `database_changes_did_reset` when the database was replaced wholesale.
class database_change_delegate {
 public:
  virtual ~database_change_delegate() = default;

  virtual void database_changes_did_update() = 0;
  virtual void database_changes_did_update_externally() = 0;
  virtual void database_changes_did_reset() = 0;
};

/// Consistent read view. Every read through one transaction observes the
/// same committed state.
template <typename Library>
class read_transaction {
 public:
  /// Raw value at key, or std::nullopt when missing.
  std::optional<registrar::schema::bytes_t> get(
      const std::string_view& key) const;

  /// Every key that starts with prefix, in key order.
  std::vector<std::string> list_keys(const std::string_view& prefix) const;
};

/// Exclusive write scope. Reads observe the transaction's own writes.
template <typename Library>
class write_transaction;

template <typename Library>
struct storage {
  /// Run fn with a fresh read transaction and return its result.
  template <typename Fn>
  auto read(Fn&& fn) const;

  /// Run fn inside a write transaction, commit, then run completions.
  ///
  /// Write transactions are serialized. Opening one while holding a lock
  /// that a concurrent writer may wait on from inside its own transaction
  /// deadlocks.
  template <typename Fn>
  auto write(Fn&& fn);

  void append_change_delegate(database_change_delegate& delegate);
  void remove_change_delegate(database_change_delegate& delegate);

  /// Signal that another process committed to the shared database.
  void notify_changed_externally() const;
  void notify_reset() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

/// Construct a concrete storage backend that lives only in memory.
template <typename Library>
storage<Library> make_in_memory_storage(const std::string_view& name);

}  // namespace registrar::storage
