#pragma once

#include <coffer/ledger/authorization.hpp>
#include <coffer/ledger/deltas.hpp>
#include <coffer/ledger/engine_options.hpp>
#include <coffer/ledger/vault_locks.hpp>
#include <coffer/schema/balance_report.hpp>
#include <coffer/schema/category_state.hpp>
#include <coffer/schema/create_cash_flow.hpp>
#include <coffer/schema/create_category.hpp>
#include <coffer/schema/create_vault.hpp>
#include <coffer/schema/create_wallet.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/schema/ledger_error.hpp>
#include <coffer/schema/money.hpp>
#include <coffer/schema/queries.hpp>
#include <coffer/schema/record_income.hpp>
#include <coffer/schema/record_refund.hpp>
#include <coffer/schema/record_transfer.hpp>
#include <coffer/schema/statistics.hpp>
#include <coffer/schema/transaction_filter.hpp>
#include <coffer/schema/transaction_record.hpp>
#include <coffer/schema/update_transaction.hpp>
#include <coffer/schema/upsert_membership.hpp>
#include <coffer/schema/vault_view.hpp>
#include <coffer/schema/void_transaction.hpp>
#include <coffer/storage/memory/storage.hpp>
#include <coffer/storage/rocksdb/storage.hpp>
#include <coffer/storage/storage.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace coffer::ledger {

/// Ledger engine for shared budgeting vaults.
///
/// Validates commands, turns them into legs, applies the legs to in-memory
/// copies of the affected balances and persists the record, the balances and
/// the vault sequence in one atomic write batch. Every mutating operation of
/// a vault runs under that vault's mutex; reads take no lock and rely on the
/// store exposing only committed batches.
///
/// Domain failures come back as ledger_result errors. storage_error and
/// money_error raised below an operation are logged and reported as
/// store_failure, currency_mismatch or invalid_amount; nothing is retried.
///
/// Instantiated for memory_storage_tag and rocksdb_storage_tag in engine.cpp.
template <typename StorageLibrary>
class engine final {
 public:
  using storage_t = coffer::storage::storage<StorageLibrary>;
  using encoder_t = coffer::schema::encoding::scale_encoder_t;

  /// encoder and storage must outlive the engine. An empty options.now falls
  /// back to the system clock.
  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  engine_options options = {});

  /// Provision a vault with its default wallet and owner membership.
  coffer::schema::ledger_result<coffer::schema::vault_view_t> create_vault(
      const coffer::schema::create_vault_t& command);

  /// Remove a vault under the configured deletion policy. Owner only.
  coffer::schema::ledger_result<coffer::schema::done_t> delete_vault(
      const coffer::schema::delete_vault_t& command);

  /// Add a wallet in the vault currency with a zero balance. Names are unique
  /// per vault, case-insensitively. Needs vault-wide write access.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> create_wallet(
      const coffer::schema::create_wallet_t& command);

  /// Stop new postings to a wallet. Its balance and history stay; voids of
  /// earlier postings still reverse onto it. Archiving twice is
  /// invalid_state.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> archive_wallet(
      const coffer::schema::archive_wallet_t& command);

  /// Change a wallet's display name, keeping names unique per vault.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> rename_wallet(
      const coffer::schema::rename_wallet_t& command);

  /// Add a cash flow, optionally capped. Same naming rules as wallets.
  coffer::schema::ledger_result<coffer::schema::cash_flow_state_t>
  create_cash_flow(const coffer::schema::create_cash_flow_t& command);

  /// Stop new postings to a cash flow; see archive_wallet.
  coffer::schema::ledger_result<coffer::schema::cash_flow_state_t>
  archive_cash_flow(const coffer::schema::archive_cash_flow_t& command);

  /// Change a cash flow's display name. Flow-scoped editors of the flow may
  /// rename it.
  coffer::schema::ledger_result<coffer::schema::cash_flow_state_t>
  rename_cash_flow(const coffer::schema::rename_cash_flow_t& command);

  /// Switch a flow between unlimited, net-capped and income-capped. Refused
  /// with max_balance_reached when the flow already sits above the new cap;
  /// income-capped flows recount their income from posted history.
  coffer::schema::ledger_result<coffer::schema::cash_flow_state_t>
  set_cash_flow_mode(const coffer::schema::set_cash_flow_mode_t& command);

  /// wallet += amount, flow += amount when given.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  record_income(const coffer::schema::record_income_t& command);

  /// wallet -= amount, flow -= amount when given. Balances may go negative.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  record_expense(const coffer::schema::record_expense_t& command);

  /// Reverse part or all of a posted non-refund transaction. amount may not
  /// exceed what earlier posted refunds left over.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  record_refund(const coffer::schema::record_refund_t& command);

  /// Move amount between two distinct wallets of the vault. Vault-wide write
  /// access only.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  transfer_wallet(const coffer::schema::record_wallet_transfer_t& command);

  /// Move amount between two distinct cash flows. Flow-scoped editors need a
  /// writing grant on both flows.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  transfer_flow(const coffer::schema::record_flow_transfer_t& command);

  /// Rewrite note and category. Never touches balances.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  update_transaction(const coffer::schema::update_transaction_t& command);

  /// Flip a posted transaction to voided and apply the inverse of its legs.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  void_transaction(const coffer::schema::void_transaction_t& command);

  /// Register a category. Names and aliases share one case-folded namespace
  /// per vault; "uncategorized" is reserved.
  coffer::schema::ledger_result<coffer::schema::category_state_t>
  create_category(const coffer::schema::create_category_t& command);

  /// Categories of a vault sorted by name; archived ones on request.
  coffer::schema::ledger_result<std::vector<coffer::schema::category_state_t>>
  list_categories(const coffer::schema::category_list_query_t& query);

  /// Rename and/or (un)archive a category. A rename rewrites the category of
  /// every transaction filed under it.
  coffer::schema::ledger_result<coffer::schema::category_state_t>
  update_category(const coffer::schema::update_category_t& command);

  /// Fold one category into another and return the survivor.
  coffer::schema::ledger_result<coffer::schema::category_state_t>
  merge_category(const coffer::schema::merge_category_t& command);

  /// Make alias resolve to an active category.
  coffer::schema::ledger_result<coffer::schema::category_alias_t>
  create_category_alias(const coffer::schema::create_category_alias_t& command);

  /// Aliases of one category sorted by spelling.
  coffer::schema::ledger_result<std::vector<coffer::schema::category_alias_t>>
  list_category_aliases(const coffer::schema::category_alias_query_t& query);

  /// Drop one alias; not_found unless it resolves to category_id.
  coffer::schema::ledger_result<coffer::schema::done_t> delete_category_alias(
      const coffer::schema::delete_category_alias_t& command);

  /// Grant or change a vault-wide role. Needs manage; the owner's own
  /// membership is fixed.
  coffer::schema::ledger_result<coffer::schema::vault_membership_t>
  upsert_vault_membership(
      const coffer::schema::upsert_vault_membership_t& command);

  /// Revoke a vault-wide role. Flow grants of the same user are kept.
  coffer::schema::ledger_result<coffer::schema::done_t>
  remove_vault_membership(
      const coffer::schema::remove_vault_membership_t& command);

  /// Grant or change a role scoped to one cash flow. Needs manage.
  coffer::schema::ledger_result<coffer::schema::flow_membership_t>
  upsert_flow_membership(
      const coffer::schema::upsert_flow_membership_t& command);

  /// Revoke a flow-scoped grant; not_found when there is none.
  coffer::schema::ledger_result<coffer::schema::done_t>
  remove_flow_membership(
      const coffer::schema::remove_flow_membership_t& command);

  /// Vault with its wallets, flows and members as the actor may see them.
  coffer::schema::ledger_result<coffer::schema::vault_view_t> get_vault(
      const coffer::schema::vault_query_t& query);

  /// One wallet; flow-scoped members are refused.
  coffer::schema::ledger_result<coffer::schema::wallet_state_t> get_wallet(
      const coffer::schema::wallet_query_t& query);

  /// One cash flow, visible to vault members and holders of a grant on it.
  coffer::schema::ledger_result<coffer::schema::cash_flow_state_t>
  get_cash_flow(const coffer::schema::cash_flow_query_t& query);

  /// One transaction, visible when the actor may view one of its targets.
  coffer::schema::ledger_result<coffer::schema::transaction_record_t>
  get_transaction(const coffer::schema::transaction_query_t& query);

  /// Newest first by occurred_at, then by sequence.
  coffer::schema::ledger_result<std::vector<coffer::schema::transaction_record_t>>
  list_transactions(const coffer::schema::transaction_filter_t& filter);

  /// list_transactions in pages of filter.limit. Pass the returned
  /// next_cursor back in filter.cursor to continue; a malformed cursor is
  /// invalid_argument.
  coffer::schema::ledger_result<coffer::schema::transaction_page_t>
  list_transactions_page(const coffer::schema::transaction_filter_t& filter);

  /// Roll-up of posted records in [from, to); see aggregate_statistics.
  /// Needs report.
  coffer::schema::ledger_result<coffer::schema::statistics_t> get_statistics(
      const coffer::schema::statistics_query_t& query);

  /// Replay posted legs against stored balances; optionally repair drift.
  coffer::schema::ledger_result<coffer::schema::balance_report_t>
  verify_balances(const coffer::schema::verify_balances_t& command);

  /// Settings the engine runs with, clock included.
  const engine_options& options() const { return options_; }

  /// Vault mutexes currently held or awaited.
  std::size_t tracked_vault_locks() const { return locks_.size(); }

 private:
  using vault_state_t = coffer::schema::vault_state_t;
  using transaction_record_t = coffer::schema::transaction_record_t;

  struct vault_context_t final {
    vault_state_t vault;
    access_grant_t grant;
  };

  /// Category a posting files under; created is set when the name was new
  /// and the row still has to be written.
  struct category_selection_t final {
    std::optional<std::string> name;
    std::optional<coffer::schema::category_state_t> created;
  };

  template <typename T, typename Body>
  coffer::schema::ledger_result<T> guarded(std::string_view operation,
                                           Body&& body);

  coffer::schema::ledger_result<vault_context_t> open_vault(
      const coffer::schema::username_t& actor,
      const coffer::schema::vault_id_t& vault_id,
      access_request_t request) const;
  coffer::schema::ledger_result<access_grant_t> authorize_actor(
      const vault_state_t& vault,
      const coffer::schema::username_t& actor,
      access_request_t request) const;

  std::optional<vault_state_t> load_vault(
      const coffer::schema::vault_id_t& vault_id) const;
  std::optional<coffer::schema::wallet_state_t> load_wallet(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::wallet_id_t& wallet_id) const;
  std::optional<coffer::schema::cash_flow_state_t> load_flow(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::flow_id_t& flow_id) const;
  std::optional<transaction_record_t> load_transaction(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::transaction_id_t& transaction_id) const;
  std::optional<coffer::schema::category_state_t> load_category(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::category_id_t& category_id) const;
  std::vector<transaction_record_t> load_refunds(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::transaction_id_t& original_id) const;
  std::vector<coffer::schema::flow_membership_t> load_flow_grants(
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::username_t& username) const;

  template <typename T>
  std::vector<T> load_scoped(std::string_view prefix,
                             const coffer::schema::vault_id_t& vault_id) const;

  /// Load target into balances. Missing targets are not_found; archived
  /// ones are invalid_state unless allow_archived is set.
  std::optional<coffer::schema::ledger_error_t> load_target(
      balance_set_t& balances,
      const coffer::schema::vault_id_t& vault_id,
      const coffer::schema::leg_target_t& target,
      bool allow_archived) const;

  /// already_exists when folded is taken by a category other than except or
  /// by any alias of the vault.
  std::optional<coffer::schema::ledger_error_t> category_name_taken(
      const coffer::schema::vault_id_t& vault_id,
      const std::string& folded,
      const std::optional<coffer::schema::category_id_t>& except) const;

  /// Map a posted category spelling to its canonical name. Unknown names
  /// create a category, consuming a vault sequence.
  coffer::schema::ledger_result<category_selection_t> resolve_category(
      vault_state_t& vault,
      const std::optional<std::string>& input) const;

  /// Rewrite the category of every record filed under from_folded.
  void stage_category_rewrite(coffer::storage::write_batch_t& batch,
                              const coffer::schema::vault_id_t& vault_id,
                              const std::string& from_folded,
                              const std::string& to_name);

  /// Validated, authorized and filtered records, newest first.
  coffer::schema::ledger_result<std::vector<transaction_record_t>>
  select_transactions(const coffer::schema::transaction_filter_t& filter);

  void stage_balances(coffer::storage::write_batch_t& batch,
                      const balance_set_t& balances);

  coffer::schema::ledger_result<transaction_record_t> post(
      vault_state_t vault,
      const coffer::schema::username_t& actor,
      coffer::schema::transaction_payload_t payload,
      const coffer::schema::money_t& amount,
      std::string note,
      category_selection_t category,
      std::optional<coffer::schema::timestamp_milliseconds_t> occurred_at,
      balance_set_t balances,
      const std::vector<coffer::schema::leg_t>& original_legs = {});

  coffer::schema::ledger_result<transaction_record_t> record_movement(
      const coffer::schema::username_t& actor,
      const coffer::schema::vault_id_t& vault_id,
      coffer::schema::transaction_payload_t payload,
      const coffer::schema::wallet_id_t& wallet_id,
      const std::optional<coffer::schema::flow_id_t>& flow_id,
      const coffer::schema::money_t& amount,
      const std::string& note,
      const std::optional<std::string>& category,
      const std::optional<coffer::schema::timestamp_milliseconds_t>&
          occurred_at);

  coffer::schema::ledger_result<transaction_record_t> record_transfer(
      const coffer::schema::username_t& actor,
      const coffer::schema::vault_id_t& vault_id,
      coffer::schema::transaction_payload_t payload,
      const coffer::schema::leg_target_t& from,
      const coffer::schema::leg_target_t& to,
      const coffer::schema::money_t& amount,
      const std::string& note,
      const std::optional<coffer::schema::timestamp_milliseconds_t>&
          occurred_at);

  encoder_t& encoder_;
  storage_t& storage_;
  engine_options options_;
  vault_locks locks_;
  std::mutex provisioning_mutex_;
};

extern template class engine<coffer::storage::memory_storage_tag>;
extern template class engine<coffer::storage::rocksdb_storage_tag>;

}  // namespace coffer::ledger
