#pragma once

#include <coffer/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for vault state, balances, grants,
// transactions and refund links. Every key below a vault embeds the 32-byte
// vault id directly after its prefix, so a prefix scan is one vault's rows.
namespace coffer::schema::key {

inline constexpr std::string_view kVaultSequenceKey{"SYS|SEQ|VAULT"};
inline constexpr std::string_view kVaultKeyPrefix{"VAULT|"};
inline constexpr std::string_view kOwnerIndexPrefix{"OWNER|"};
inline constexpr std::string_view kVaultMemberPrefix{"VMEMBER|"};
inline constexpr std::string_view kFlowMemberPrefix{"FMEMBER|"};
inline constexpr std::string_view kWalletKeyPrefix{"WALLET|"};
inline constexpr std::string_view kFlowKeyPrefix{"FLOW|"};
inline constexpr std::string_view kTransactionKeyPrefix{"TX|"};
inline constexpr std::string_view kRefundIndexPrefix{"REFUND|"};
inline constexpr std::string_view kCategoryKeyPrefix{"CATEGORY|"};
inline constexpr std::string_view kCategoryAliasPrefix{"CALIAS|"};

/// Prefixes whose rows belong to a single vault (cascade delete scope).
inline constexpr std::array<std::string_view, 8> kVaultScopedKeyspaces{
    kVaultMemberPrefix,    kFlowMemberPrefix,  kWalletKeyPrefix,
    kFlowKeyPrefix,        kTransactionKeyPrefix, kRefundIndexPrefix,
    kCategoryKeyPrefix,    kCategoryAliasPrefix};

/// Case-folded form used for name uniqueness (vault names per owner, wallet,
/// cash flow and category names per vault, category aliases).
///
/// Only ASCII letters are folded. Bytes >= 0x80 pass through unchanged, so
/// "Épicerie" and "épicerie" stay distinct names; no Unicode case mapping or
/// normalization is applied.
std::string fold_name(std::string_view name);

bytes_t make_vault_sequence_key();
bytes_t make_vault_key(const vault_id_t& vault_id);
bytes_t make_owner_index_key(std::string_view owner, std::string_view name);

bytes_t make_vault_scoped_prefix(std::string_view prefix,
                                 const vault_id_t& vault_id);

bytes_t make_vault_member_key(const vault_id_t& vault_id,
                              std::string_view username);
bytes_t make_flow_member_key(const vault_id_t& vault_id,
                             const flow_id_t& flow_id,
                             std::string_view username);
bytes_t make_flow_member_prefix(const vault_id_t& vault_id,
                                const flow_id_t& flow_id);
bytes_t make_wallet_key(const vault_id_t& vault_id,
                        const wallet_id_t& wallet_id);
bytes_t make_flow_key(const vault_id_t& vault_id, const flow_id_t& flow_id);
bytes_t make_transaction_key(const vault_id_t& vault_id,
                             const transaction_id_t& transaction_id);
bytes_t make_refund_index_key(const vault_id_t& vault_id,
                              const transaction_id_t& original_id,
                              const transaction_id_t& refund_id);
bytes_t make_refund_index_prefix(const vault_id_t& vault_id,
                                 const transaction_id_t& original_id);
bytes_t make_category_key(const vault_id_t& vault_id,
                          const hash32_t& category_id);
/// Keyed by the folded alias, so a lookup is a point read.
bytes_t make_category_alias_key(const vault_id_t& vault_id,
                                std::string_view alias);

/// Opaque paging cursor: hex of the big-endian occurred_at and sequence of
/// the last record on a page.
std::string make_transaction_cursor(timestamp_milliseconds_t occurred_at,
                                    uint64_t sequence);

struct transaction_cursor_t final {
  timestamp_milliseconds_t occurred_at{};
  uint64_t sequence{};
};

std::optional<transaction_cursor_t> try_parse_transaction_cursor(
    std::string_view cursor);

/// Deterministic ids: BLAKE3 over entity tag, parent id and sequence.
vault_id_t make_vault_id(uint64_t sequence);
wallet_id_t make_wallet_id(const vault_id_t& vault_id, uint64_t sequence);
flow_id_t make_flow_id(const vault_id_t& vault_id, uint64_t sequence);
transaction_id_t make_transaction_id(const vault_id_t& vault_id,
                                     uint64_t sequence);
hash32_t make_category_id(const vault_id_t& vault_id, uint64_t sequence);

}  // namespace coffer::schema::key
