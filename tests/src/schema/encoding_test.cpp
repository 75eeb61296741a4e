#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/schema/transaction_record.hpp>
#include <coffer/schema/vault_membership.hpp>
#include <coffer/schema/vault_state.hpp>
#include <coffer/schema/wallet_state.hpp>
#include <gtest/gtest.h>

#include <string>

namespace {

using encoder_t = coffer::schema::encoding::scale_encoder_t;

coffer::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = coffer::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

template <typename T>
T reencode(const T& value) {
  auto encoder = encoder_t{};
  auto bytes = encoder.encode(value);
  auto decoded = encoder.try_decode<T>(coffer::schema::bytes_view_t{bytes});
  EXPECT_TRUE(decoded.has_value());
  return decoded.value_or(T{});
}

}  // namespace

TEST(encoding, vault_state_survives_the_store) {
  auto vault = coffer::schema::vault_state_t{};
  vault.id = make_hash(1);
  vault.owner = "ana";
  vault.name = "Home";
  vault.currency = coffer::schema::currency_t::chf;
  vault.next_sequence = 7;
  vault.created_at = 1'700'000'000'000;

  auto decoded = reencode(vault);
  EXPECT_EQ(decoded.version, 1u);
  EXPECT_EQ(decoded.id, vault.id);
  EXPECT_EQ(decoded.owner, "ana");
  EXPECT_EQ(decoded.currency, coffer::schema::currency_t::chf);
  EXPECT_EQ(decoded.next_sequence, 7u);
}

TEST(encoding, transaction_record_keeps_payload_and_legs) {
  auto record = coffer::schema::transaction_record_t{};
  record.id = make_hash(2);
  record.vault_id = make_hash(1);
  record.sequence = 3;
  record.payload = coffer::schema::expense_t{.wallet_id = make_hash(4),
                                             .flow_id = make_hash(5)};
  record.amount = 1250;
  record.note = "groceries";
  record.category = "food";
  record.created_by = "ana";
  record.state = coffer::schema::transaction_state_t::voided;
  record.void_info =
      coffer::schema::void_info_t{.voided_at = 42, .voided_by = "bob"};
  record.legs = {
      coffer::schema::leg_t{
          .target = coffer::schema::wallet_target_t{.wallet_id = make_hash(4)},
          .amount = -1250},
      coffer::schema::leg_t{
          .target = coffer::schema::flow_target_t{.flow_id = make_hash(5)},
          .amount = -1250}};

  auto decoded = reencode(record);
  EXPECT_EQ(coffer::schema::kind_of(decoded),
            coffer::schema::transaction_kind_t::expense);
  const auto& expense = std::get<coffer::schema::expense_t>(decoded.payload);
  EXPECT_EQ(expense.flow_id, make_hash(5));
  EXPECT_EQ(decoded.category, std::optional<std::string>{"food"});
  EXPECT_FALSE(coffer::schema::is_posted(decoded));
  ASSERT_TRUE(decoded.void_info.has_value());
  EXPECT_EQ(decoded.void_info->voided_by, "bob");
  EXPECT_EQ(decoded.legs, record.legs);
}

TEST(encoding, truncated_bytes_do_not_decode) {
  auto encoder = encoder_t{};
  auto membership = coffer::schema::vault_membership_t{};
  membership.username = "carol";
  membership.role = coffer::schema::membership_role_t::viewer;
  auto bytes = encoder.encode(membership);
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<coffer::schema::vault_membership_t>(
                       coffer::schema::bytes_view_t{bytes})
                   .has_value());
}
