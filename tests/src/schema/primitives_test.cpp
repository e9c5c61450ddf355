#include <gtest/gtest.h>
#include <registrar/schema/primitives.hpp>
#include <registrar/testing/common.hpp>

TEST(primitives, uuid_to_string_is_upper_case) {
  auto uuid = registrar::schema::make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9"});
  EXPECT_EQ(registrar::schema::to_string(uuid),
            "0A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9");
}

TEST(primitives, uuid_parses_either_case) {
  auto lower = registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9"});
  auto upper = registrar::schema::try_make_uuid(
      std::string_view{"0A1B2C3D-4E5F-6071-8293-A4B5C6D7E8F9"});
  ASSERT_TRUE(lower.has_value());
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(*lower, *upper);
  EXPECT_EQ(lower->data[0], 0x0A);
  EXPECT_EQ(lower->data[15], 0xF9);
}

TEST(primitives, try_make_uuid_rejects_malformed_input) {
  EXPECT_FALSE(registrar::schema::try_make_uuid(std::string_view{""}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d4e5f60718293a4b5c6d7e8f9"}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8fz"}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293+a4b5c6d7e8f9"}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"{0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f9}"}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8f-"}));
  EXPECT_FALSE(registrar::schema::try_make_uuid(
      std::string_view{"0a1b2c3d-4e5f-6071-8293-a4b5c6d7e8 9"}));
}

TEST(primitives, optional_uuid_to_string_marks_absence) {
  EXPECT_EQ(registrar::schema::to_string(
                std::optional<registrar::schema::uuid_t>{}),
            "<none>");
  auto uuid = registrar::testing::make_uuid(0x10);
  EXPECT_EQ(registrar::schema::to_string(std::optional{uuid}),
            registrar::schema::to_string(uuid));
}

TEST(primitives, random_uuids_differ) {
  EXPECT_NE(registrar::schema::make_random_uuid(),
            registrar::schema::make_random_uuid());
}

TEST(primitives, e164_structure_is_checked) {
  EXPECT_TRUE(registrar::schema::is_structurally_valid_e164("+15555550100"));
  EXPECT_TRUE(registrar::schema::is_structurally_valid_e164("+1"));
  EXPECT_FALSE(registrar::schema::is_structurally_valid_e164("15555550100"));
  EXPECT_FALSE(registrar::schema::is_structurally_valid_e164("+"));
  EXPECT_FALSE(registrar::schema::is_structurally_valid_e164("+05555550100"));
  EXPECT_FALSE(registrar::schema::is_structurally_valid_e164("+1555-555-0100"));
  EXPECT_FALSE(
      registrar::schema::is_structurally_valid_e164("+1234567890123456"));
}
