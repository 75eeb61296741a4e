#include <gtest/gtest.h>
#include <coffer/schema/primitives.hpp>

#include <string>

TEST(primitives, vault_ids_parse_from_hex) {
  auto hash = coffer::schema::try_make_hash32(
      std::string_view{"0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191A1B1C1D1E1F20"});
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_EQ(coffer::schema::to_hex(*hash),
            "0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
}

TEST(primitives, malformed_ids_are_rejected) {
  EXPECT_FALSE(coffer::schema::try_make_hash32("abc").has_value());
  EXPECT_FALSE(coffer::schema::try_make_hash32("0102").has_value());
  EXPECT_FALSE(coffer::schema::try_make_hash32(std::string(64, 'g')).has_value());
  EXPECT_FALSE(coffer::schema::try_make_hash32(
                   "0x0102030405060708090a0b0c0d0e0f10"
                   "1112131415161718191a1b1c1d1e1f20")
                   .has_value());
  EXPECT_TRUE(coffer::schema::try_make_hash32(std::string(64, 'f')).has_value());
}

TEST(primitives, short_id_is_first_four_bytes) {
  auto hash = coffer::schema::hash32_t{};
  hash[0] = 0xDE;
  hash[1] = 0xAD;
  hash[2] = 0xBE;
  hash[3] = 0xEF;
  hash[4] = 0x11;
  EXPECT_EQ(coffer::schema::short_id(hash), "deadbeef");
}

TEST(primitives, text_and_bytes_convert_both_ways) {
  auto text = std::string{"wallet"};
  auto bytes = coffer::schema::make_bytes(text);
  EXPECT_EQ(bytes.size(), 6u);
  EXPECT_EQ(coffer::schema::make_string_view(bytes), "wallet");
  EXPECT_EQ(coffer::schema::make_string(coffer::schema::make_bytes_view(text)),
            text);
  EXPECT_EQ(coffer::schema::to_hex(coffer::schema::make_bytes_view("A|")),
            "417c");
}

TEST(primitives, hex_strings_parse_to_bytes) {
  auto bytes = coffer::schema::try_make_bytes("00ff7A");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, (coffer::schema::bytes_t{0x00, 0xff, 0x7a}));
  EXPECT_TRUE(coffer::schema::try_make_bytes("").has_value());
  EXPECT_FALSE(coffer::schema::try_make_bytes("abc").has_value());
  EXPECT_FALSE(coffer::schema::try_make_bytes("0g").has_value());
}
