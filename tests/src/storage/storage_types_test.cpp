#include <registrar/storage/storage.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using storage_t =
    registrar::storage::storage<registrar::storage::rocksdb_storage_tag>;
using read_transaction_t = storage_t::read_transaction_t;
using write_transaction_t = storage_t::write_transaction_t;

void put_text(write_transaction_t& tx,
              const std::string& key,
              const std::string& value) {
  tx.put(key, registrar::schema::make_bytes_view(value));
}

std::optional<std::string> get_text(const read_transaction_t& tx,
                                    const std::string& key) {
  auto value = tx.get(key);
  if (!value) {
    return std::nullopt;
  }
  return registrar::schema::make_string(*value);
}

class counting_delegate final
    : public registrar::storage::database_change_delegate {
 public:
  void database_changes_did_update() override { ++updates; }
  void database_changes_did_update_externally() override { ++external; }
  void database_changes_did_reset() override { ++resets; }

  int updates{0};
  int external{0};
  int resets{0};
};

}  // namespace

TEST(storage_types, committed_writes_are_visible_to_later_reads) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_commit");
  storage.write([](write_transaction_t& tx) { put_text(tx, "a|one", "1"); });

  auto value = storage.read(
      [](const read_transaction_t& tx) { return get_text(tx, "a|one"); });
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "1");
}

TEST(storage_types, write_transaction_reads_its_own_writes) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_own_writes");
  auto seen = storage.write([](write_transaction_t& tx) {
    put_text(tx, "a|one", "1");
    tx.remove("a|missing");
    return get_text(tx, "a|one");
  });
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(*seen, "1");
}

TEST(storage_types, throwing_writer_rolls_back) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_rollback");
  storage.write([](write_transaction_t& tx) { put_text(tx, "a|one", "1"); });

  auto completion_ran = false;
  EXPECT_THROW(storage.write([&](write_transaction_t& tx) {
    put_text(tx, "a|one", "2");
    put_text(tx, "a|two", "2");
    tx.add_completion([&] { completion_ran = true; });
    throw std::runtime_error{"abort"};
  }),
               std::runtime_error);

  EXPECT_FALSE(completion_ran);
  storage.read([](const read_transaction_t& tx) {
    EXPECT_EQ(get_text(tx, "a|one"), std::optional<std::string>{"1"});
    EXPECT_FALSE(tx.get("a|two").has_value());
  });
}

TEST(storage_types, rollback_handlers_run_after_the_write_lock_is_released) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_rollback_handlers");
  auto seen = std::optional<std::string>{};
  EXPECT_THROW(storage.write([&](write_transaction_t& tx) {
    put_text(tx, "a|one", "1");
    tx.add_rollback_handler([&] {
      // A new write would deadlock if the failed one still held the lock.
      storage.write([](write_transaction_t& retry) {
        put_text(retry, "a|one", "retried");
      });
      seen = storage.read_latest(
          [](const read_transaction_t& read) { return get_text(read, "a|one"); });
    });
    throw std::runtime_error{"abort"};
  }),
               std::runtime_error);
  EXPECT_EQ(seen, std::optional<std::string>{"retried"});
}

TEST(storage_types, rollback_handlers_are_dropped_on_commit) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_rollback_commit");
  auto handler_ran = false;
  storage.write([&](write_transaction_t& tx) {
    put_text(tx, "a|one", "1");
    tx.add_rollback_handler([&] { handler_ran = true; });
  });
  EXPECT_FALSE(handler_ran);
}

TEST(storage_types, completions_run_after_commit_in_order) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_completions");
  auto order = std::vector<std::string>{};
  storage.write([&](write_transaction_t& tx) {
    put_text(tx, "a|one", "1");
    tx.add_completion([&] {
      // The write is committed by the time completions run.
      auto value = storage.read(
          [](const read_transaction_t& read) { return get_text(read, "a|one"); });
      order.push_back(value.value_or("missing"));
    });
    tx.add_completion([&] { order.push_back("second"); });
    order.push_back("body");
  });
  EXPECT_EQ(order, (std::vector<std::string>{"body", "1", "second"}));
}

TEST(storage_types, read_transaction_sees_a_fixed_snapshot) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_snapshot");
  storage.write([](write_transaction_t& tx) { put_text(tx, "a|one", "1"); });

  storage.read([&](const read_transaction_t& tx) {
    storage.write([](write_transaction_t& write) { put_text(write, "a|one", "2"); });
    EXPECT_EQ(get_text(tx, "a|one"), std::optional<std::string>{"1"});
  });
  auto latest = storage.read(
      [](const read_transaction_t& tx) { return get_text(tx, "a|one"); });
  EXPECT_EQ(latest, std::optional<std::string>{"2"});
}

TEST(storage_types, list_keys_is_scoped_to_prefix) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_prefix");
  storage.write([](write_transaction_t& tx) {
    put_text(tx, "a|two", "2");
    put_text(tx, "a|one", "1");
    put_text(tx, "ab|one", "x");
    put_text(tx, "b|one", "9");
  });
  auto keys = storage.read(
      [](const read_transaction_t& tx) { return tx.list_keys("a|"); });
  EXPECT_EQ(keys, (std::vector<std::string>{"a|one", "a|two"}));
}

TEST(storage_types, delegates_hear_commits_and_external_changes) {
  auto storage = registrar::storage::make_in_memory_storage<
      registrar::storage::rocksdb_storage_tag>("storage_delegates");
  auto delegate = counting_delegate{};
  storage.append_change_delegate(delegate);

  storage.write([](write_transaction_t& tx) { put_text(tx, "a|one", "1"); });
  storage.notify_changed_externally();
  storage.notify_reset();
  EXPECT_THROW(storage.write([](write_transaction_t&) {
    throw std::runtime_error{"abort"};
  }),
               std::runtime_error);

  EXPECT_EQ(delegate.updates, 1);
  EXPECT_EQ(delegate.external, 1);
  EXPECT_EQ(delegate.resets, 1);

  storage.remove_change_delegate(delegate);
  storage.notify_changed_externally();
  EXPECT_EQ(delegate.external, 1);
}

TEST(storage_types, on_disk_storage_persists_across_reopen) {
  auto db = registrar::testing::make_db_path("registrar_storage_reopen");
  {
    auto storage =
        registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(db);
    storage.write([](write_transaction_t& tx) { put_text(tx, "a|one", "1"); });
  }
  {
    auto storage =
        registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(db);
    auto value = storage.read(
        [](const read_transaction_t& tx) { return get_text(tx, "a|one"); });
    EXPECT_EQ(value, std::optional<std::string>{"1"});
  }
  registrar::testing::remove_path(db);
}
