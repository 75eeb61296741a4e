#include <coffer/ledger/validation.hpp>
#include <coffer/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using coffer::schema::ledger_entity_t;
using coffer::schema::ledger_error_code;

TEST(validation, names_are_trimmed_and_bounded) {
  EXPECT_FALSE(coffer::ledger::validate_name(" Cash ", ledger_entity_t::wallet));
  auto blank = coffer::ledger::validate_name("   ", ledger_entity_t::wallet);
  ASSERT_TRUE(blank.has_value());
  EXPECT_EQ(blank->code, ledger_error_code::invalid_argument);
  EXPECT_EQ(blank->entity, ledger_entity_t::wallet);
  EXPECT_EQ(blank->field, "name");
  EXPECT_TRUE(coffer::ledger::validate_name(std::string(65, 'a'),
                                            ledger_entity_t::vault));
  EXPECT_EQ(coffer::ledger::trim_copy("\t Food \n"), "Food");
}

TEST(validation, amounts_must_be_positive_and_in_vault_currency) {
  EXPECT_FALSE(coffer::ledger::validate_amount(coffer::testing::eur(1)));
  auto zero = coffer::ledger::validate_amount(coffer::testing::eur(0));
  ASSERT_TRUE(zero.has_value());
  EXPECT_EQ(zero->code, ledger_error_code::invalid_amount);
  EXPECT_TRUE(coffer::ledger::validate_amount(coffer::testing::eur(-5)));

  auto mismatch = coffer::ledger::validate_currency(
      coffer::testing::eur(5), coffer::schema::currency_t::usd);
  ASSERT_TRUE(mismatch.has_value());
  EXPECT_EQ(mismatch->code, ledger_error_code::currency_mismatch);
}

TEST(validation, notes_categories_and_windows) {
  EXPECT_FALSE(coffer::ledger::validate_note(""));
  EXPECT_TRUE(coffer::ledger::validate_note(std::string(1025, 'n')));
  EXPECT_FALSE(coffer::ledger::validate_category(std::nullopt));
  EXPECT_TRUE(coffer::ledger::validate_category(std::string{" "}));
  EXPECT_FALSE(coffer::ledger::validate_window(1, 2));
  EXPECT_TRUE(coffer::ledger::validate_window(2, 2));
  EXPECT_FALSE(coffer::ledger::validate_window(std::nullopt, 2));
  EXPECT_TRUE(coffer::ledger::validate_username("", "actor"));
}

TEST(validation, flow_caps_must_be_positive) {
  EXPECT_FALSE(coffer::ledger::validate_flow_cap(std::nullopt, false));
  EXPECT_FALSE(coffer::ledger::validate_flow_cap(1000, true));
  EXPECT_EQ(coffer::ledger::validate_flow_cap(0, false)->code,
            ledger_error_code::invalid_amount);
  EXPECT_EQ(coffer::ledger::validate_flow_cap(-5, true)->field, "max_balance");
  auto uncapped = coffer::ledger::validate_flow_cap(std::nullopt, true);
  ASSERT_TRUE(uncapped.has_value());
  EXPECT_EQ(uncapped->code, ledger_error_code::invalid_argument);
  EXPECT_EQ(uncapped->entity, ledger_entity_t::cash_flow);
}
