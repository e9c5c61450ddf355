#include <registrar/app/environment.hpp>
#include <registrar/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <string>

TEST(environment, wires_an_in_memory_account_subsystem) {
  auto delivered = std::atomic<int>{0};
  auto options = registrar::app::environment_options{
      .db_path = "environment_memory", .in_memory = true, .is_main_app = true};
  auto env = registrar::app::environment{options};

  env.bus().subscribe(
      [&](const registrar::events::account_event_t&) { ++delivered; });

  env.accounts().begin_verification("+15555550100",
                                    registrar::testing::make_uuid(1),
                                    std::nullopt);
  env.accounts().did_register();
  env.bus().flush();

  EXPECT_TRUE(env.accounts().is_registered_and_ready());
  EXPECT_EQ(delivered.load(), 2);
}

TEST(environment, secondary_process_follows_external_changes) {
  auto db = registrar::testing::make_db_path("registrar_environment");
  {
    auto main = registrar::app::environment{registrar::app::environment_options{
        .db_path = db, .in_memory = false, .is_main_app = true}};
    main.accounts().set_is_onboarded(true);
  }
  {
    auto secondary =
        registrar::app::environment{registrar::app::environment_options{
            .db_path = db, .in_memory = false, .is_main_app = false}};
    EXPECT_TRUE(secondary.accounts().is_onboarded());

    secondary.storage().write(
        [&](registrar::account::write_transaction_t& tx) {
          secondary.accounts().set_is_onboarded(false, tx);
        });
    EXPECT_FALSE(secondary.accounts().is_onboarded());

    secondary.database_changed_externally();
    EXPECT_FALSE(secondary.cache().get_or_load()->is_onboarded);
  }
  registrar::testing::remove_path(db);
}
