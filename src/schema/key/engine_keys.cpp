#include <coffer/schema/key/builder.hpp>
#include <coffer/schema/key/engine_keys.hpp>

#include <boost/endian/conversion.hpp>

#include <algorithm>

namespace coffer::schema::key {

namespace {

hash32_t derive_id(std::string_view tag,
                   const hash32_t& parent,
                   uint64_t sequence) {
  return builder{}.write(tag).write(parent).write(sequence).digest();
}

}  // namespace

// ASCII only: multi-byte UTF-8 sequences are copied byte for byte.
std::string fold_name(std::string_view name) {
  auto folded = std::string{name};
  std::ranges::transform(folded, std::begin(folded), [](char c) {
    return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
  });
  return folded;
}

bytes_t make_vault_sequence_key() {
  return make_bytes(kVaultSequenceKey);
}

bytes_t make_vault_key(const vault_id_t& vault_id) {
  return builder{}.write(kVaultKeyPrefix).write(vault_id).data;
}

bytes_t make_owner_index_key(std::string_view owner, std::string_view name) {
  return builder{}
      .write(kOwnerIndexPrefix)
      .write_sized(owner)
      .write(fold_name(name))
      .data;
}

bytes_t make_vault_scoped_prefix(std::string_view prefix,
                                 const vault_id_t& vault_id) {
  return builder{}.write(prefix).write(vault_id).data;
}

bytes_t make_vault_member_key(const vault_id_t& vault_id,
                              std::string_view username) {
  return builder{}
      .write(kVaultMemberPrefix)
      .write(vault_id)
      .write_sized(username)
      .data;
}

bytes_t make_flow_member_key(const vault_id_t& vault_id,
                             const flow_id_t& flow_id,
                             std::string_view username) {
  auto out = builder{.data = make_flow_member_prefix(vault_id, flow_id)};
  return out.write_sized(username).data;
}

bytes_t make_flow_member_prefix(const vault_id_t& vault_id,
                                const flow_id_t& flow_id) {
  return builder{}
      .write(kFlowMemberPrefix)
      .write(vault_id)
      .write(flow_id)
      .data;
}

bytes_t make_wallet_key(const vault_id_t& vault_id,
                        const wallet_id_t& wallet_id) {
  return builder{}.write(kWalletKeyPrefix).write(vault_id).write(wallet_id).data;
}

bytes_t make_flow_key(const vault_id_t& vault_id, const flow_id_t& flow_id) {
  return builder{}.write(kFlowKeyPrefix).write(vault_id).write(flow_id).data;
}

bytes_t make_transaction_key(const vault_id_t& vault_id,
                             const transaction_id_t& transaction_id) {
  return builder{}
      .write(kTransactionKeyPrefix)
      .write(vault_id)
      .write(transaction_id)
      .data;
}

bytes_t make_refund_index_key(const vault_id_t& vault_id,
                              const transaction_id_t& original_id,
                              const transaction_id_t& refund_id) {
  auto out = builder{.data = make_refund_index_prefix(vault_id, original_id)};
  return out.write(refund_id).data;
}

bytes_t make_refund_index_prefix(const vault_id_t& vault_id,
                                 const transaction_id_t& original_id) {
  return builder{}
      .write(kRefundIndexPrefix)
      .write(vault_id)
      .write(original_id)
      .data;
}

bytes_t make_category_key(const vault_id_t& vault_id,
                          const hash32_t& category_id) {
  return builder{}
      .write(kCategoryKeyPrefix)
      .write(vault_id)
      .write(category_id)
      .data;
}

bytes_t make_category_alias_key(const vault_id_t& vault_id,
                                std::string_view alias) {
  return builder{}
      .write(kCategoryAliasPrefix)
      .write(vault_id)
      .write(fold_name(alias))
      .data;
}

std::string make_transaction_cursor(timestamp_milliseconds_t occurred_at,
                                    uint64_t sequence) {
  auto bytes = builder{}.write(occurred_at).write(sequence).data;
  return to_hex(bytes_view_t{bytes});
}

std::optional<transaction_cursor_t> try_parse_transaction_cursor(
    std::string_view cursor) {
  auto bytes = try_make_bytes(cursor);
  if (!bytes || bytes->size() != 2 * sizeof(uint64_t)) {
    return std::nullopt;
  }
  return transaction_cursor_t{
      .occurred_at = boost::endian::load_big_u64(bytes->data()),
      .sequence = boost::endian::load_big_u64(bytes->data() + sizeof(uint64_t))};
}

vault_id_t make_vault_id(uint64_t sequence) {
  return derive_id("vault", vault_id_t{}, sequence);
}

wallet_id_t make_wallet_id(const vault_id_t& vault_id, uint64_t sequence) {
  return derive_id("wallet", vault_id, sequence);
}

flow_id_t make_flow_id(const vault_id_t& vault_id, uint64_t sequence) {
  return derive_id("flow", vault_id, sequence);
}

transaction_id_t make_transaction_id(const vault_id_t& vault_id,
                                     uint64_t sequence) {
  return derive_id("transaction", vault_id, sequence);
}

hash32_t make_category_id(const vault_id_t& vault_id, uint64_t sequence) {
  return derive_id("category", vault_id, sequence);
}

}  // namespace coffer::schema::key
