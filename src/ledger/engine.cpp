#include <coffer/ledger/engine.hpp>

#include <coffer/ledger/statistics.hpp>
#include <coffer/ledger/validation.hpp>
#include <coffer/schema/key/engine_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace coffer::ledger {

namespace detail {

template <typename T>
coffer::schema::ledger_result<T> fail(coffer::schema::ledger_error_code code,
                                      coffer::schema::ledger_entity_t entity,
                                      std::string field,
                                      std::string message) {
  return coffer::schema::ledger_result<T>::failure(
      coffer::schema::ledger_error_t{.code = code,
                                     .entity = entity,
                                     .field = std::move(field),
                                     .message = std::move(message)});
}

template <typename T>
coffer::schema::ledger_result<T> fail(coffer::schema::ledger_error_t error) {
  return coffer::schema::ledger_result<T>::failure(std::move(error));
}

template <typename T, typename U>
coffer::schema::ledger_result<T> forward_error(
    const coffer::schema::ledger_result<U>& result) {
  return coffer::schema::ledger_result<T>::failure(result.error.value());
}

template <typename T>
coffer::schema::ledger_result<T> not_found(
    coffer::schema::ledger_entity_t entity,
    std::string field,
    const coffer::schema::hash32_t& id) {
  return fail<T>(coffer::schema::ledger_error_code::not_found, entity,
                 std::move(field),
                 fmt::format("{} {} not found", to_string(entity),
                             coffer::schema::short_id(id)));
}

template <typename T>
coffer::schema::ledger_result<std::decay_t<T>> succeed(T&& value) {
  return coffer::schema::ledger_result<std::decay_t<T>>::success(
      std::forward<T>(value));
}

coffer::schema::bytes_view_t view(const coffer::schema::bytes_t& bytes) {
  return coffer::schema::bytes_view_t{bytes};
}

std::optional<coffer::schema::ledger_error_t> reserved_category(
    const std::string& folded,
    std::string_view field) {
  if (folded != coffer::schema::kUncategorizedName) {
    return std::nullopt;
  }
  return coffer::schema::ledger_error_t{
      .code = coffer::schema::ledger_error_code::invalid_argument,
      .entity = coffer::schema::ledger_entity_t::category,
      .field = std::string{field},
      .message = fmt::format("'{}' is reserved",
                             coffer::schema::kUncategorizedName)};
}

}  // namespace detail

template <typename StorageLibrary>
engine<StorageLibrary>::engine(encoder_t& encoder,
                               storage_t& storage,
                               engine_options options)
    : encoder_{encoder}, storage_{storage}, options_{std::move(options)} {
  if (!options_.now) {
    options_.now = system_time_now;
  }
  spdlog::info("ledger engine ready (deletion policy {}, default currency {})",
               to_string(options_.deletion_policy),
               schema::to_string(options_.default_currency));
}

template <typename StorageLibrary>
template <typename T, typename Body>
schema::ledger_result<T> engine<StorageLibrary>::guarded(
    std::string_view operation,
    Body&& body) {
  try {
    auto result = body();
    if (!result.ok()) {
      const auto& error = result.error.value();
      spdlog::warn("{} rejected: {} on {}.{}: {}", operation,
                   schema::to_string(error.code),
                   schema::to_string(error.entity), error.field,
                   error.message);
    }
    return result;
  } catch (const coffer::storage::storage_error& e) {
    spdlog::error("{} failed in store: {}", operation, e.what());
    return detail::fail<T>(schema::ledger_error_code::store_failure,
                           schema::ledger_entity_t::store, "", e.what());
  } catch (const schema::money_error& e) {
    auto code = e.reason() == schema::money_error::reason_t::currency_mismatch
                    ? schema::ledger_error_code::currency_mismatch
                    : schema::ledger_error_code::invalid_amount;
    spdlog::warn("{} rejected by money arithmetic: {}", operation, e.what());
    return detail::fail<T>(code, schema::ledger_entity_t::transaction,
                           "amount", e.what());
  }
}

// Loading.

template <typename StorageLibrary>
std::optional<schema::vault_state_t> engine<StorageLibrary>::load_vault(
    const schema::vault_id_t& vault_id) const {
  auto key = schema::key::make_vault_key(vault_id);
  return storage_.template get<schema::vault_state_t>(encoder_,
                                                      detail::view(key));
}

template <typename StorageLibrary>
std::optional<schema::wallet_state_t> engine<StorageLibrary>::load_wallet(
    const schema::vault_id_t& vault_id,
    const schema::wallet_id_t& wallet_id) const {
  auto key = schema::key::make_wallet_key(vault_id, wallet_id);
  return storage_.template get<schema::wallet_state_t>(encoder_,
                                                       detail::view(key));
}

template <typename StorageLibrary>
std::optional<schema::cash_flow_state_t> engine<StorageLibrary>::load_flow(
    const schema::vault_id_t& vault_id,
    const schema::flow_id_t& flow_id) const {
  auto key = schema::key::make_flow_key(vault_id, flow_id);
  return storage_.template get<schema::cash_flow_state_t>(encoder_,
                                                          detail::view(key));
}

template <typename StorageLibrary>
std::optional<schema::transaction_record_t>
engine<StorageLibrary>::load_transaction(
    const schema::vault_id_t& vault_id,
    const schema::transaction_id_t& transaction_id) const {
  auto key = schema::key::make_transaction_key(vault_id, transaction_id);
  return storage_.template get<schema::transaction_record_t>(
      encoder_, detail::view(key));
}

template <typename StorageLibrary>
std::optional<schema::category_state_t> engine<StorageLibrary>::load_category(
    const schema::vault_id_t& vault_id,
    const schema::category_id_t& category_id) const {
  auto key = schema::key::make_category_key(vault_id, category_id);
  return storage_.template get<schema::category_state_t>(encoder_,
                                                         detail::view(key));
}

template <typename StorageLibrary>
template <typename T>
std::vector<T> engine<StorageLibrary>::load_scoped(
    std::string_view prefix,
    const schema::vault_id_t& vault_id) const {
  auto key = schema::key::make_vault_scoped_prefix(prefix, vault_id);
  return coffer::storage::list_decoded<T>(storage_, encoder_,
                                          detail::view(key));
}

template <typename StorageLibrary>
std::vector<schema::transaction_record_t> engine<StorageLibrary>::load_refunds(
    const schema::vault_id_t& vault_id,
    const schema::transaction_id_t& original_id) const {
  auto prefix = schema::key::make_refund_index_prefix(vault_id, original_id);
  auto refunds = std::vector<schema::transaction_record_t>{};
  for (const auto& refund_id :
       coffer::storage::list_decoded<schema::transaction_id_t>(
           storage_, encoder_, detail::view(prefix))) {
    auto refund = load_transaction(vault_id, refund_id);
    if (!refund) {
      throw coffer::storage::storage_error{
          fmt::format("refund index of {} points at missing transaction {}",
                      schema::short_id(original_id),
                      schema::short_id(refund_id))};
    }
    refunds.push_back(std::move(*refund));
  }
  return refunds;
}

template <typename StorageLibrary>
std::vector<schema::flow_membership_t> engine<StorageLibrary>::load_flow_grants(
    const schema::vault_id_t& vault_id,
    const schema::username_t& username) const {
  auto grants = load_scoped<schema::flow_membership_t>(
      schema::key::kFlowMemberPrefix, vault_id);
  std::erase_if(grants, [&](const schema::flow_membership_t& grant) {
    return grant.username != username;
  });
  return grants;
}

template <typename StorageLibrary>
std::optional<schema::ledger_error_t> engine<StorageLibrary>::load_target(
    balance_set_t& balances,
    const schema::vault_id_t& vault_id,
    const schema::leg_target_t& target,
    bool allow_archived) const {
  return std::visit(
      overloaded{
          [&](const schema::wallet_target_t& wallet_target)
              -> std::optional<schema::ledger_error_t> {
            if (balances.wallets.contains(wallet_target.wallet_id)) {
              return std::nullopt;
            }
            auto wallet = load_wallet(vault_id, wallet_target.wallet_id);
            if (!wallet) {
              return detail::not_found<schema::done_t>(
                         schema::ledger_entity_t::wallet, "wallet_id",
                         wallet_target.wallet_id)
                  .error;
            }
            if (wallet->archived && !allow_archived) {
              return schema::ledger_error_t{
                  .code = schema::ledger_error_code::invalid_state,
                  .entity = schema::ledger_entity_t::wallet,
                  .field = "wallet_id",
                  .message = fmt::format("wallet '{}' is archived",
                                         wallet->name)};
            }
            balances.wallets.emplace(wallet_target.wallet_id,
                                     std::move(*wallet));
            return std::nullopt;
          },
          [&](const schema::flow_target_t& flow_target)
              -> std::optional<schema::ledger_error_t> {
            if (balances.flows.contains(flow_target.flow_id)) {
              return std::nullopt;
            }
            auto flow = load_flow(vault_id, flow_target.flow_id);
            if (!flow) {
              return detail::not_found<schema::done_t>(
                         schema::ledger_entity_t::cash_flow, "flow_id",
                         flow_target.flow_id)
                  .error;
            }
            if (flow->archived && !allow_archived) {
              return schema::ledger_error_t{
                  .code = schema::ledger_error_code::invalid_state,
                  .entity = schema::ledger_entity_t::cash_flow,
                  .field = "flow_id",
                  .message = fmt::format("cash flow '{}' is archived",
                                         flow->name)};
            }
            balances.flows.emplace(flow_target.flow_id, std::move(*flow));
            return std::nullopt;
          }},
      target);
}

// Authorization.

template <typename StorageLibrary>
schema::ledger_result<access_grant_t> engine<StorageLibrary>::authorize_actor(
    const schema::vault_state_t& vault,
    const schema::username_t& actor,
    access_request_t request) const {
  auto member_key = schema::key::make_vault_member_key(vault.id, actor);
  auto subject = access_subject_t{
      .username = actor,
      .vault = vault,
      .membership = storage_.template get<schema::vault_membership_t>(
          encoder_, detail::view(member_key)),
      .flow_grants = load_flow_grants(vault.id, actor)};
  return authorize(subject, request);
}

template <typename StorageLibrary>
auto engine<StorageLibrary>::open_vault(const schema::username_t& actor,
                                        const schema::vault_id_t& vault_id,
                                        access_request_t request) const
    -> schema::ledger_result<vault_context_t> {
  if (auto error = validate_username(actor, "actor")) {
    return detail::fail<vault_context_t>(std::move(*error));
  }
  auto vault = load_vault(vault_id);
  if (!vault) {
    return detail::not_found<vault_context_t>(schema::ledger_entity_t::vault,
                                              "vault_id", vault_id);
  }
  auto grant = authorize_actor(*vault, actor, std::move(request));
  if (!grant.ok()) {
    return detail::forward_error<vault_context_t>(grant);
  }
  return detail::succeed(vault_context_t{.vault = std::move(*vault),
                                         .grant = std::move(*grant.value)});
}

// Categories.

template <typename StorageLibrary>
std::optional<schema::ledger_error_t>
engine<StorageLibrary>::category_name_taken(
    const schema::vault_id_t& vault_id,
    const std::string& folded,
    const std::optional<schema::category_id_t>& except) const {
  for (const auto& category : load_scoped<schema::category_state_t>(
           schema::key::kCategoryKeyPrefix, vault_id)) {
    if (except && category.id == *except) {
      continue;
    }
    if (schema::key::fold_name(category.name) == folded) {
      return schema::ledger_error_t{
          .code = schema::ledger_error_code::already_exists,
          .entity = schema::ledger_entity_t::category,
          .field = "name",
          .message = fmt::format("category '{}' already exists",
                                 category.name)};
    }
  }
  auto alias_key = schema::key::make_category_alias_key(vault_id, folded);
  if (auto alias = storage_.template get<schema::category_alias_t>(
          encoder_, detail::view(alias_key))) {
    return schema::ledger_error_t{
        .code = schema::ledger_error_code::already_exists,
        .entity = schema::ledger_entity_t::category,
        .field = "name",
        .message = fmt::format("'{}' is already an alias", alias->alias)};
  }
  return std::nullopt;
}

template <typename StorageLibrary>
auto engine<StorageLibrary>::resolve_category(
    schema::vault_state_t& vault,
    const std::optional<std::string>& input) const
    -> schema::ledger_result<category_selection_t> {
  using result_t = category_selection_t;
  if (!input) {
    return detail::succeed(result_t{});
  }
  auto name = trim_copy(*input);
  auto folded = schema::key::fold_name(name);
  if (folded == schema::kUncategorizedName) {
    return detail::succeed(result_t{});
  }
  auto archived = [](const std::string& category_name) {
    return detail::fail<result_t>(
        schema::ledger_error_code::invalid_state,
        schema::ledger_entity_t::category, "category",
        fmt::format("category '{}' is archived", category_name));
  };

  // Active names win over aliases, aliases over archived names.
  auto categories = load_scoped<schema::category_state_t>(
      schema::key::kCategoryKeyPrefix, vault.id);
  auto matches = [&](const schema::category_state_t& category) {
    return schema::key::fold_name(category.name) == folded;
  };
  for (auto& category : categories) {
    if (!category.archived && matches(category)) {
      return detail::succeed(
          result_t{.name = std::move(category.name), .created = std::nullopt});
    }
  }
  auto alias_key = schema::key::make_category_alias_key(vault.id, folded);
  if (auto alias = storage_.template get<schema::category_alias_t>(
          encoder_, detail::view(alias_key))) {
    auto category = load_category(vault.id, alias->category_id);
    if (!category) {
      throw coffer::storage::storage_error{
          fmt::format("alias '{}' points at missing category {}", alias->alias,
                      schema::short_id(alias->category_id))};
    }
    if (category->archived) {
      return archived(category->name);
    }
    return detail::succeed(
        result_t{.name = std::move(category->name), .created = std::nullopt});
  }
  for (const auto& category : categories) {
    if (matches(category)) {
      return archived(category.name);
    }
  }

  auto created = schema::category_state_t{};
  created.id = schema::key::make_category_id(vault.id, vault.next_sequence++);
  created.vault_id = vault.id;
  created.name = name;
  created.created_at = options_.now();
  return detail::succeed(
      result_t{.name = std::move(name), .created = std::move(created)});
}

template <typename StorageLibrary>
void engine<StorageLibrary>::stage_category_rewrite(
    coffer::storage::write_batch_t& batch,
    const schema::vault_id_t& vault_id,
    const std::string& from_folded,
    const std::string& to_name) {
  auto refiled = std::size_t{0};
  for (auto& record : load_scoped<schema::transaction_record_t>(
           schema::key::kTransactionKeyPrefix, vault_id)) {
    if (!record.category ||
        schema::key::fold_name(*record.category) != from_folded) {
      continue;
    }
    record.category = to_name;
    batch.put(encoder_, schema::key::make_transaction_key(vault_id, record.id),
              record);
    ++refiled;
  }
  spdlog::debug("refiling {} transactions from '{}' to '{}'", refiled,
                from_folded, to_name);
}

// Commit path.

template <typename StorageLibrary>
void engine<StorageLibrary>::stage_balances(
    coffer::storage::write_batch_t& batch,
    const balance_set_t& balances) {
  for (const auto& [id, wallet] : balances.wallets) {
    batch.put(encoder_, schema::key::make_wallet_key(wallet.vault_id, id),
              wallet);
  }
  for (const auto& [id, flow] : balances.flows) {
    batch.put(encoder_, schema::key::make_flow_key(flow.vault_id, id), flow);
  }
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::post(
    schema::vault_state_t vault,
    const schema::username_t& actor,
    schema::transaction_payload_t payload,
    const schema::money_t& amount,
    std::string note,
    category_selection_t category,
    std::optional<schema::timestamp_milliseconds_t> occurred_at,
    balance_set_t balances,
    const std::vector<schema::leg_t>& original_legs) {
  auto now = options_.now();
  auto record = schema::transaction_record_t{};
  record.id = schema::key::make_transaction_id(vault.id, vault.next_sequence);
  record.vault_id = vault.id;
  record.sequence = vault.next_sequence++;
  record.payload = std::move(payload);
  record.amount = amount.minor();
  record.currency = amount.currency();
  record.occurred_at = occurred_at.value_or(now);
  record.recorded_at = now;
  record.note = std::move(note);
  record.category = std::move(category.name);
  record.created_by = actor;
  record.state = schema::transaction_state_t::posted;
  record.legs = compute_legs(record.payload, record.amount, original_legs);
  apply_legs(balances, record.legs, vault.currency);
  if (auto error = admit_flow_legs(balances, record.legs)) {
    return detail::fail<schema::transaction_record_t>(std::move(*error));
  }

  auto batch = coffer::storage::write_batch_t{};
  batch.put(encoder_, schema::key::make_transaction_key(vault.id, record.id),
            record);
  if (const auto* refund = std::get_if<schema::refund_t>(&record.payload)) {
    batch.put(encoder_,
              schema::key::make_refund_index_key(vault.id, refund->original_id,
                                                 record.id),
              record.id);
  }
  if (category.created) {
    batch.put(encoder_,
              schema::key::make_category_key(vault.id, category.created->id),
              *category.created);
  }
  stage_balances(batch, balances);
  batch.put(encoder_, schema::key::make_vault_key(vault.id), vault);
  storage_.commit(batch);

  spdlog::info("posted {} {} #{} in vault {} by {}",
               schema::to_string(schema::kind_of(record)), amount.format(),
               record.sequence, schema::short_id(vault.id), actor);
  return detail::succeed(std::move(record));
}

// Vault provisioning.

template <typename StorageLibrary>
schema::ledger_result<schema::vault_view_t>
engine<StorageLibrary>::create_vault(const schema::create_vault_t& command) {
  using result_t = schema::vault_view_t;
  return guarded<result_t>(
      "create_vault", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_username(command.actor, "actor")) {
          return detail::fail<result_t>(std::move(*error));
        }
        if (auto error =
                validate_name(command.name, schema::ledger_entity_t::vault)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);

        auto lock = std::scoped_lock{provisioning_mutex_};
        auto index_key = schema::key::make_owner_index_key(command.actor, name);
        if (storage_.get(detail::view(index_key))) {
          return detail::fail<result_t>(
              schema::ledger_error_code::already_exists,
              schema::ledger_entity_t::vault, "name",
              fmt::format("{} already owns a vault named '{}'", command.actor,
                          name));
        }

        auto sequence_key = schema::key::make_vault_sequence_key();
        auto sequence = storage_
                            .template get<uint64_t>(
                                encoder_, detail::view(sequence_key))
                            .value_or(0);
        auto now = options_.now();

        auto view = result_t{};
        view.vault.id = schema::key::make_vault_id(sequence);
        view.vault.owner = command.actor;
        view.vault.name = name;
        view.vault.currency =
            command.currency.value_or(options_.default_currency);
        view.vault.created_at = now;

        auto wallet = schema::wallet_state_t{};
        wallet.id = schema::key::make_wallet_id(view.vault.id,
                                                view.vault.next_sequence++);
        wallet.vault_id = view.vault.id;
        wallet.name = options_.default_wallet_name;
        wallet.currency = view.vault.currency;
        wallet.created_at = now;

        auto owner = schema::vault_membership_t{};
        owner.vault_id = view.vault.id;
        owner.username = command.actor;
        owner.role = schema::membership_role_t::owner;
        owner.granted_by = command.actor;
        owner.granted_at = now;

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, sequence_key, sequence + 1);
        batch.put(encoder_, schema::key::make_vault_key(view.vault.id),
                  view.vault);
        batch.put(encoder_, index_key, view.vault.id);
        batch.put(encoder_,
                  schema::key::make_wallet_key(view.vault.id, wallet.id),
                  wallet);
        batch.put(encoder_,
                  schema::key::make_vault_member_key(view.vault.id,
                                                     command.actor),
                  owner);
        storage_.commit(batch);

        spdlog::info("created vault {} '{}' ({}) for {}",
                     schema::short_id(view.vault.id), view.vault.name,
                     schema::to_string(view.vault.currency), command.actor);
        view.wallets.push_back(std::move(wallet));
        view.members.push_back(std::move(owner));
        return detail::succeed(std::move(view));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::done_t> engine<StorageLibrary>::delete_vault(
    const schema::delete_vault_t& command) {
  using result_t = schema::done_t;
  return guarded<result_t>(
      "delete_vault", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto provisioning_lock = std::scoped_lock{provisioning_mutex_};
        auto context =
            open_vault(command.actor, command.vault_id,
                       access_request_t{.capability = capability_t::delete_vault,
                                        .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;

        // Only transactions count as content; see vault_deletion_policy_t.
        auto transactions_prefix = schema::key::make_vault_scoped_prefix(
            schema::key::kTransactionKeyPrefix, vault.id);
        if (options_.deletion_policy ==
                vault_deletion_policy_t::reject_if_not_empty &&
            !storage_.list_by_prefix(detail::view(transactions_prefix))
                 .empty()) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::vault, "vault_id",
              fmt::format("vault {} still holds transactions",
                          schema::short_id(vault.id)));
        }

        auto batch = coffer::storage::write_batch_t{};
        for (const auto& keyspace : schema::key::kVaultScopedKeyspaces) {
          auto prefix =
              schema::key::make_vault_scoped_prefix(keyspace, vault.id);
          for (const auto& entry :
               storage_.list_by_prefix(detail::view(prefix))) {
            batch.erase(entry.first);
          }
        }
        batch.erase(schema::key::make_owner_index_key(vault.owner, vault.name));
        batch.erase(schema::key::make_vault_key(vault.id));
        storage_.commit(batch);

        spdlog::info("deleted vault {} ({} rows, policy {})",
                     schema::short_id(vault.id), batch.size(),
                     to_string(options_.deletion_policy));
        return detail::succeed(result_t{});
      });
}

// Wallets and cash flows.

template <typename StorageLibrary>
schema::ledger_result<schema::wallet_state_t>
engine<StorageLibrary>::create_wallet(const schema::create_wallet_t& command) {
  using result_t = schema::wallet_state_t;
  return guarded<result_t>(
      "create_wallet", [&]() -> schema::ledger_result<result_t> {
        if (auto error =
                validate_name(command.name, schema::ledger_entity_t::wallet)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto vault = std::move(context.value->vault);

        auto folded = schema::key::fold_name(name);
        for (const auto& existing : load_scoped<schema::wallet_state_t>(
                 schema::key::kWalletKeyPrefix, vault.id)) {
          if (schema::key::fold_name(existing.name) == folded) {
            return detail::fail<result_t>(
                schema::ledger_error_code::already_exists,
                schema::ledger_entity_t::wallet, "name",
                fmt::format("wallet '{}' already exists", existing.name));
          }
        }

        auto wallet = result_t{};
        wallet.id =
            schema::key::make_wallet_id(vault.id, vault.next_sequence++);
        wallet.vault_id = vault.id;
        wallet.name = std::move(name);
        wallet.currency = vault.currency;
        wallet.created_at = options_.now();

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, schema::key::make_wallet_key(vault.id, wallet.id),
                  wallet);
        batch.put(encoder_, schema::key::make_vault_key(vault.id), vault);
        storage_.commit(batch);

        spdlog::info("created wallet {} '{}' in vault {}",
                     schema::short_id(wallet.id), wallet.name,
                     schema::short_id(vault.id));
        return detail::succeed(std::move(wallet));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::wallet_state_t>
engine<StorageLibrary>::archive_wallet(
    const schema::archive_wallet_t& command) {
  using result_t = schema::wallet_state_t;
  return guarded<result_t>(
      "archive_wallet", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write,
                             .targets = {schema::wallet_target_t{
                                 .wallet_id = command.wallet_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto wallet = load_wallet(command.vault_id, command.wallet_id);
        if (!wallet) {
          return detail::not_found<result_t>(schema::ledger_entity_t::wallet,
                                             "wallet_id", command.wallet_id);
        }
        if (wallet->archived) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::wallet, "wallet_id",
              fmt::format("wallet '{}' is already archived", wallet->name));
        }
        wallet->archived = true;

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_wallet_key(wallet->vault_id, wallet->id),
                  *wallet);
        storage_.commit(batch);
        spdlog::info("archived wallet {} '{}'", schema::short_id(wallet->id),
                     wallet->name);
        return detail::succeed(std::move(*wallet));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::wallet_state_t>
engine<StorageLibrary>::rename_wallet(const schema::rename_wallet_t& command) {
  using result_t = schema::wallet_state_t;
  return guarded<result_t>(
      "rename_wallet", [&]() -> schema::ledger_result<result_t> {
        if (auto error =
                validate_name(command.name, schema::ledger_entity_t::wallet)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write,
                             .targets = {schema::wallet_target_t{
                                 .wallet_id = command.wallet_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto wallet = load_wallet(command.vault_id, command.wallet_id);
        if (!wallet) {
          return detail::not_found<result_t>(schema::ledger_entity_t::wallet,
                                             "wallet_id", command.wallet_id);
        }

        auto folded = schema::key::fold_name(name);
        for (const auto& existing : load_scoped<schema::wallet_state_t>(
                 schema::key::kWalletKeyPrefix, command.vault_id)) {
          if (existing.id != wallet->id &&
              schema::key::fold_name(existing.name) == folded) {
            return detail::fail<result_t>(
                schema::ledger_error_code::already_exists,
                schema::ledger_entity_t::wallet, "name",
                fmt::format("wallet '{}' already exists", existing.name));
          }
        }
        auto previous = std::exchange(wallet->name, std::move(name));

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_wallet_key(wallet->vault_id, wallet->id),
                  *wallet);
        storage_.commit(batch);
        spdlog::info("renamed wallet {} '{}' to '{}'",
                     schema::short_id(wallet->id), previous, wallet->name);
        return detail::succeed(std::move(*wallet));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::cash_flow_state_t>
engine<StorageLibrary>::create_cash_flow(
    const schema::create_cash_flow_t& command) {
  using result_t = schema::cash_flow_state_t;
  return guarded<result_t>(
      "create_cash_flow", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_name(command.name,
                                       schema::ledger_entity_t::cash_flow)) {
          return detail::fail<result_t>(std::move(*error));
        }
        if (auto error =
                validate_flow_cap(command.max_balance, command.income_capped)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto vault = std::move(context.value->vault);

        auto folded = schema::key::fold_name(name);
        for (const auto& existing : load_scoped<schema::cash_flow_state_t>(
                 schema::key::kFlowKeyPrefix, vault.id)) {
          if (schema::key::fold_name(existing.name) == folded) {
            return detail::fail<result_t>(
                schema::ledger_error_code::already_exists,
                schema::ledger_entity_t::cash_flow, "name",
                fmt::format("cash flow '{}' already exists", existing.name));
          }
        }

        auto flow = result_t{};
        flow.id = schema::key::make_flow_id(vault.id, vault.next_sequence++);
        flow.vault_id = vault.id;
        flow.name = std::move(name);
        flow.currency = vault.currency;
        flow.created_at = options_.now();
        flow.max_balance = command.max_balance;
        if (command.income_capped) {
          flow.income_balance = 0;
        }

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, schema::key::make_flow_key(vault.id, flow.id),
                  flow);
        batch.put(encoder_, schema::key::make_vault_key(vault.id), vault);
        storage_.commit(batch);

        spdlog::info("created cash flow {} '{}' ({}) in vault {}",
                     schema::short_id(flow.id), flow.name,
                     schema::to_string(schema::mode_of(flow)),
                     schema::short_id(vault.id));
        return detail::succeed(std::move(flow));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::cash_flow_state_t>
engine<StorageLibrary>::archive_cash_flow(
    const schema::archive_cash_flow_t& command) {
  using result_t = schema::cash_flow_state_t;
  return guarded<result_t>(
      "archive_cash_flow", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{
                .capability = capability_t::write,
                .targets = {schema::flow_target_t{.flow_id = command.flow_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto flow = load_flow(command.vault_id, command.flow_id);
        if (!flow) {
          return detail::not_found<result_t>(schema::ledger_entity_t::cash_flow,
                                             "flow_id", command.flow_id);
        }
        if (flow->archived) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::cash_flow, "flow_id",
              fmt::format("cash flow '{}' is already archived", flow->name));
        }
        flow->archived = true;

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, schema::key::make_flow_key(flow->vault_id, flow->id),
                  *flow);
        storage_.commit(batch);
        spdlog::info("archived cash flow {} '{}'", schema::short_id(flow->id),
                     flow->name);
        return detail::succeed(std::move(*flow));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::cash_flow_state_t>
engine<StorageLibrary>::rename_cash_flow(
    const schema::rename_cash_flow_t& command) {
  using result_t = schema::cash_flow_state_t;
  return guarded<result_t>(
      "rename_cash_flow", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_name(command.name,
                                       schema::ledger_entity_t::cash_flow)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{
                .capability = capability_t::write,
                .targets = {schema::flow_target_t{.flow_id = command.flow_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto flow = load_flow(command.vault_id, command.flow_id);
        if (!flow) {
          return detail::not_found<result_t>(schema::ledger_entity_t::cash_flow,
                                             "flow_id", command.flow_id);
        }

        auto folded = schema::key::fold_name(name);
        for (const auto& existing : load_scoped<schema::cash_flow_state_t>(
                 schema::key::kFlowKeyPrefix, command.vault_id)) {
          if (existing.id != flow->id &&
              schema::key::fold_name(existing.name) == folded) {
            return detail::fail<result_t>(
                schema::ledger_error_code::already_exists,
                schema::ledger_entity_t::cash_flow, "name",
                fmt::format("cash flow '{}' already exists", existing.name));
          }
        }
        auto previous = std::exchange(flow->name, std::move(name));

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, schema::key::make_flow_key(flow->vault_id, flow->id),
                  *flow);
        storage_.commit(batch);
        spdlog::info("renamed cash flow {} '{}' to '{}'",
                     schema::short_id(flow->id), previous, flow->name);
        return detail::succeed(std::move(*flow));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::cash_flow_state_t>
engine<StorageLibrary>::set_cash_flow_mode(
    const schema::set_cash_flow_mode_t& command) {
  using result_t = schema::cash_flow_state_t;
  return guarded<result_t>(
      "set_cash_flow_mode", [&]() -> schema::ledger_result<result_t> {
        if (auto error =
                validate_flow_cap(command.max_balance, command.income_capped)) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{
                .capability = capability_t::write,
                .targets = {schema::flow_target_t{.flow_id = command.flow_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto flow = load_flow(command.vault_id, command.flow_id);
        if (!flow) {
          return detail::not_found<result_t>(schema::ledger_entity_t::cash_flow,
                                             "flow_id", command.flow_id);
        }

        flow->max_balance = command.max_balance;
        flow->income_balance.reset();
        if (command.max_balance) {
          auto counted = flow->balance;
          if (command.income_capped) {
            counted = replay_flow_income(
                load_scoped<schema::transaction_record_t>(
                    schema::key::kTransactionKeyPrefix, command.vault_id),
                flow->id);
            flow->income_balance = counted;
          }
          if (counted > *command.max_balance) {
            return detail::fail<result_t>(
                schema::ledger_error_code::max_balance_reached,
                schema::ledger_entity_t::cash_flow, "max_balance",
                fmt::format("cash flow '{}' already counts {} against a cap "
                            "of {}",
                            flow->name,
                            schema::money_t{counted, flow->currency}.format(),
                            schema::money_t{*command.max_balance,
                                            flow->currency}
                                .format()));
          }
        }

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_, schema::key::make_flow_key(flow->vault_id, flow->id),
                  *flow);
        storage_.commit(batch);
        spdlog::info("cash flow {} '{}' is now {}", schema::short_id(flow->id),
                     flow->name, schema::to_string(schema::mode_of(*flow)));
        return detail::succeed(std::move(*flow));
      });
}

// Transactions.

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::record_movement(
    const schema::username_t& actor,
    const schema::vault_id_t& vault_id,
    schema::transaction_payload_t payload,
    const schema::wallet_id_t& wallet_id,
    const std::optional<schema::flow_id_t>& flow_id,
    const schema::money_t& amount,
    const std::string& note,
    const std::optional<std::string>& category,
    const std::optional<schema::timestamp_milliseconds_t>& occurred_at) {
  using result_t = schema::transaction_record_t;
  if (auto error = validate_amount(amount)) {
    return detail::fail<result_t>(std::move(*error));
  }
  if (auto error = validate_note(note)) {
    return detail::fail<result_t>(std::move(*error));
  }
  if (auto error = validate_category(category)) {
    return detail::fail<result_t>(std::move(*error));
  }

  auto targets = std::vector<schema::leg_target_t>{
      schema::wallet_target_t{.wallet_id = wallet_id}};
  if (flow_id) {
    targets.push_back(schema::flow_target_t{.flow_id = *flow_id});
  }

  auto vault_lock = locks_.acquire(vault_id);
  auto context =
      open_vault(actor, vault_id,
                 access_request_t{.capability = capability_t::write,
                                  .targets = targets});
  if (!context.ok()) {
    return detail::forward_error<result_t>(context);
  }
  auto& vault = context.value->vault;
  if (auto error = validate_currency(amount, vault.currency)) {
    return detail::fail<result_t>(std::move(*error));
  }

  auto balances = balance_set_t{};
  for (const auto& target : targets) {
    if (auto error = load_target(balances, vault.id, target, false)) {
      return detail::fail<result_t>(std::move(*error));
    }
  }
  auto selection = resolve_category(vault, category);
  if (!selection.ok()) {
    return detail::forward_error<result_t>(selection);
  }
  return post(std::move(vault), actor, std::move(payload), amount, note,
              std::move(*selection.value), occurred_at, std::move(balances));
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::record_income(const schema::record_income_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>("record_income", [&]() {
    return record_movement(
        command.actor, command.vault_id,
        schema::income_t{.wallet_id = command.wallet_id,
                         .flow_id = command.flow_id},
        command.wallet_id, command.flow_id, command.amount, command.note,
        command.category, command.occurred_at);
  });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::record_expense(
    const schema::record_expense_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>("record_expense", [&]() {
    return record_movement(
        command.actor, command.vault_id,
        schema::expense_t{.wallet_id = command.wallet_id,
                          .flow_id = command.flow_id},
        command.wallet_id, command.flow_id, command.amount, command.note,
        command.category, command.occurred_at);
  });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::record_transfer(
    const schema::username_t& actor,
    const schema::vault_id_t& vault_id,
    schema::transaction_payload_t payload,
    const schema::leg_target_t& from,
    const schema::leg_target_t& to,
    const schema::money_t& amount,
    const std::string& note,
    const std::optional<schema::timestamp_milliseconds_t>& occurred_at) {
  using result_t = schema::transaction_record_t;
  if (from == to) {
    auto wallets = schema::is_wallet_target(from);
    return detail::fail<result_t>(
        wallets ? schema::ledger_error_code::same_wallet
                : schema::ledger_error_code::same_flow,
        wallets ? schema::ledger_entity_t::wallet
                : schema::ledger_entity_t::cash_flow,
        "to", "transfer source and destination are the same");
  }
  if (auto error = validate_amount(amount)) {
    return detail::fail<result_t>(std::move(*error));
  }
  if (auto error = validate_note(note)) {
    return detail::fail<result_t>(std::move(*error));
  }

  auto vault_lock = locks_.acquire(vault_id);
  auto context =
      open_vault(actor, vault_id,
                 access_request_t{.capability = capability_t::write,
                                  .targets = {from, to}});
  if (!context.ok()) {
    return detail::forward_error<result_t>(context);
  }
  auto& vault = context.value->vault;
  if (auto error = validate_currency(amount, vault.currency)) {
    return detail::fail<result_t>(std::move(*error));
  }

  auto balances = balance_set_t{};
  for (const auto& target : {from, to}) {
    if (auto error = load_target(balances, vault.id, target, false)) {
      return detail::fail<result_t>(std::move(*error));
    }
  }
  return post(std::move(vault), actor, std::move(payload), amount, note,
              category_selection_t{}, occurred_at, std::move(balances));
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::transfer_wallet(
    const schema::record_wallet_transfer_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>("transfer_wallet", [&]() {
    return record_transfer(
        command.actor, command.vault_id,
        schema::wallet_transfer_t{.from_wallet_id = command.from_wallet_id,
                                  .to_wallet_id = command.to_wallet_id},
        schema::wallet_target_t{.wallet_id = command.from_wallet_id},
        schema::wallet_target_t{.wallet_id = command.to_wallet_id},
        command.amount, command.note, command.occurred_at);
  });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::transfer_flow(
    const schema::record_flow_transfer_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>("transfer_flow", [&]() {
    return record_transfer(
        command.actor, command.vault_id,
        schema::flow_transfer_t{.from_flow_id = command.from_flow_id,
                                .to_flow_id = command.to_flow_id},
        schema::flow_target_t{.flow_id = command.from_flow_id},
        schema::flow_target_t{.flow_id = command.to_flow_id}, command.amount,
        command.note, command.occurred_at);
  });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::record_refund(const schema::record_refund_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>(
      "record_refund", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_amount(command.amount)) {
          return detail::fail<result_t>(std::move(*error));
        }
        if (auto error = validate_note(command.note)) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto& vault = context.value->vault;

        auto original = load_transaction(vault.id, command.original_id);
        if (!original) {
          return detail::not_found<result_t>(
              schema::ledger_entity_t::transaction, "original_id",
              command.original_id);
        }
        auto grant = authorize_actor(
            vault, command.actor,
            access_request_t{.capability = capability_t::write,
                             .targets = participants_of(original->legs)});
        if (!grant.ok()) {
          return detail::forward_error<result_t>(grant);
        }
        if (auto error = validate_currency(command.amount, vault.currency)) {
          return detail::fail<result_t>(std::move(*error));
        }
        if (!schema::is_posted(*original)) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::transaction, "original_id",
              "cannot refund a voided transaction");
        }
        if (schema::kind_of(*original) == schema::transaction_kind_t::refund) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::transaction, "original_id",
              "cannot refund a refund");
        }

        auto remainder = refundable_remainder(
            *original, load_refunds(vault.id, original->id));
        if (command.amount.minor() > remainder) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_amount,
              schema::ledger_entity_t::transaction, "amount",
              fmt::format("refund {} exceeds refundable remainder {}",
                          command.amount.format(),
                          schema::money_t{remainder, vault.currency}.format()));
        }

        auto balances = balance_set_t{};
        for (const auto& target : participants_of(original->legs)) {
          if (auto error = load_target(balances, vault.id, target, false)) {
            return detail::fail<result_t>(std::move(*error));
          }
        }
        // Refunds inherit the original's canonical category as is.
        return post(std::move(vault), command.actor,
                    schema::refund_t{.original_id = original->id},
                    command.amount, command.note,
                    category_selection_t{.name = original->category,
                                         .created = std::nullopt},
                    command.occurred_at, std::move(balances), original->legs);
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::update_transaction(
    const schema::update_transaction_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>(
      "update_transaction", [&]() -> schema::ledger_result<result_t> {
        if (command.note) {
          if (auto error = validate_note(*command.note)) {
            return detail::fail<result_t>(std::move(*error));
          }
        }
        if (auto error = validate_category(command.category)) {
          return detail::fail<result_t>(std::move(*error));
        }
        if (command.category && command.clear_category) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_argument,
              schema::ledger_entity_t::transaction, "category",
              "category cannot be set and cleared at once");
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto& vault = context.value->vault;

        auto record = load_transaction(vault.id, command.transaction_id);
        if (!record) {
          return detail::not_found<result_t>(
              schema::ledger_entity_t::transaction, "transaction_id",
              command.transaction_id);
        }
        auto participants = participants_of(record->legs);
        auto grant = authorize_actor(
            vault, command.actor,
            access_request_t{.capability = capability_t::write,
                             .targets = participants});
        if (!grant.ok()) {
          return detail::forward_error<result_t>(grant);
        }
        if (!schema::is_posted(*record)) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::transaction, "transaction_id",
              "voided transactions cannot be edited");
        }

        auto immutable = [](std::string field) {
          return detail::fail<result_t>(
              schema::ledger_error_code::immutable,
              schema::ledger_entity_t::transaction, field,
              fmt::format("{} of a posted transaction cannot change", field));
        };
        if (command.amount && (command.amount->minor() != record->amount ||
                               command.amount->currency() != record->currency)) {
          return immutable("amount");
        }
        if (command.kind && *command.kind != schema::kind_of(*record)) {
          return immutable("kind");
        }
        if (command.participants) {
          auto requested = *command.participants;
          std::ranges::sort(requested);
          requested.erase(std::unique(std::begin(requested),
                                      std::end(requested)),
                          std::end(requested));
          if (requested != participants) {
            return immutable("participants");
          }
        }

        auto selection = category_selection_t{};
        if (command.category) {
          auto resolved = resolve_category(vault, command.category);
          if (!resolved.ok()) {
            return detail::forward_error<result_t>(resolved);
          }
          selection = std::move(*resolved.value);
          record->category = selection.name;
        } else if (command.clear_category) {
          record->category.reset();
        }
        if (command.note) {
          record->note = *command.note;
        }

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_transaction_key(vault.id, record->id),
                  *record);
        if (selection.created) {
          batch.put(encoder_,
                    schema::key::make_category_key(vault.id,
                                                   selection.created->id),
                    *selection.created);
          batch.put(encoder_, schema::key::make_vault_key(vault.id), vault);
        }
        storage_.commit(batch);
        spdlog::info("updated transaction {} in vault {}",
                     schema::short_id(record->id), schema::short_id(vault.id));
        return detail::succeed(std::move(*record));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::void_transaction(
    const schema::void_transaction_t& command) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>(
      "void_transaction", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;

        auto record = load_transaction(vault.id, command.transaction_id);
        if (!record) {
          return detail::not_found<result_t>(
              schema::ledger_entity_t::transaction, "transaction_id",
              command.transaction_id);
        }
        auto grant = authorize_actor(
            vault, command.actor,
            access_request_t{.capability = capability_t::write,
                             .targets = participants_of(record->legs)});
        if (!grant.ok()) {
          return detail::forward_error<result_t>(grant);
        }
        if (!schema::is_posted(*record)) {
          return detail::fail<result_t>(
              schema::ledger_error_code::already_voided,
              schema::ledger_entity_t::transaction, "transaction_id",
              fmt::format("transaction {} is already voided",
                          schema::short_id(record->id)));
        }
        if (schema::kind_of(*record) != schema::transaction_kind_t::refund) {
          for (const auto& refund : load_refunds(vault.id, record->id)) {
            if (schema::is_posted(refund)) {
              return detail::fail<result_t>(
                  schema::ledger_error_code::invalid_state,
                  schema::ledger_entity_t::transaction, "transaction_id",
                  fmt::format("refund {} must be voided first",
                              schema::short_id(refund.id)));
            }
          }
        }

        // Archived targets still take the reversal, and caps never refuse it.
        auto balances = balance_set_t{};
        for (const auto& target : participants_of(record->legs)) {
          if (auto error = load_target(balances, vault.id, target, true)) {
            return detail::fail<result_t>(std::move(*error));
          }
        }
        apply_legs(balances, invert_legs(record->legs, record->currency),
                   vault.currency);
        release_flow_legs(balances, record->legs);

        record->state = schema::transaction_state_t::voided;
        record->void_info = schema::void_info_t{.voided_at = options_.now(),
                                                .voided_by = command.actor};

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_transaction_key(vault.id, record->id),
                  *record);
        stage_balances(batch, balances);
        storage_.commit(batch);
        spdlog::info("voided transaction {} #{} in vault {} by {}",
                     schema::short_id(record->id), record->sequence,
                     schema::short_id(vault.id), command.actor);
        return detail::succeed(std::move(*record));
      });
}

// Category registry.

template <typename StorageLibrary>
schema::ledger_result<schema::category_state_t>
engine<StorageLibrary>::create_category(
    const schema::create_category_t& command) {
  using result_t = schema::category_state_t;
  return guarded<result_t>(
      "create_category", [&]() -> schema::ledger_result<result_t> {
        if (auto error =
                validate_name(command.name, schema::ledger_entity_t::category)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto name = trim_copy(command.name);
        auto folded = schema::key::fold_name(name);
        if (auto error = detail::reserved_category(folded, "name")) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto vault = std::move(context.value->vault);
        if (auto error = category_name_taken(vault.id, folded, std::nullopt)) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto category = result_t{};
        category.id =
            schema::key::make_category_id(vault.id, vault.next_sequence++);
        category.vault_id = vault.id;
        category.name = std::move(name);
        category.created_at = options_.now();

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_category_key(vault.id, category.id),
                  category);
        batch.put(encoder_, schema::key::make_vault_key(vault.id), vault);
        storage_.commit(batch);
        spdlog::info("created category {} '{}' in vault {}",
                     schema::short_id(category.id), category.name,
                     schema::short_id(vault.id));
        return detail::succeed(std::move(category));
      });
}

template <typename StorageLibrary>
schema::ledger_result<std::vector<schema::category_state_t>>
engine<StorageLibrary>::list_categories(
    const schema::category_list_query_t& query) {
  using result_t = std::vector<schema::category_state_t>;
  return guarded<result_t>(
      "list_categories", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto categories = load_scoped<schema::category_state_t>(
            schema::key::kCategoryKeyPrefix, query.vault_id);
        if (!query.include_archived) {
          std::erase_if(categories, [](const schema::category_state_t& c) {
            return c.archived;
          });
        }
        std::ranges::sort(categories, {}, [](const schema::category_state_t& c) {
          return schema::key::fold_name(c.name);
        });
        return detail::succeed(std::move(categories));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::category_state_t>
engine<StorageLibrary>::update_category(
    const schema::update_category_t& command) {
  using result_t = schema::category_state_t;
  return guarded<result_t>(
      "update_category", [&]() -> schema::ledger_result<result_t> {
        if (command.name) {
          if (auto error = validate_name(*command.name,
                                         schema::ledger_entity_t::category)) {
            return detail::fail<result_t>(std::move(*error));
          }
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        auto category = load_category(vault.id, command.category_id);
        if (!category) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "category_id",
                                             command.category_id);
        }

        auto name = command.name ? trim_copy(*command.name) : category->name;
        auto folded = schema::key::fold_name(name);
        auto reactivated =
            command.archived && !*command.archived && category->archived;
        if (command.name || reactivated) {
          if (auto error = detail::reserved_category(folded, "name")) {
            return detail::fail<result_t>(std::move(*error));
          }
          if (auto error =
                  category_name_taken(vault.id, folded, category->id)) {
            return detail::fail<result_t>(std::move(*error));
          }
        }

        auto batch = coffer::storage::write_batch_t{};
        if (name != category->name) {
          stage_category_rewrite(batch, vault.id,
                                 schema::key::fold_name(category->name), name);
          category->name = std::move(name);
        }
        if (command.archived) {
          category->archived = *command.archived;
        }
        batch.put(encoder_,
                  schema::key::make_category_key(vault.id, category->id),
                  *category);
        storage_.commit(batch);
        spdlog::info("updated category {} '{}' (archived {})",
                     schema::short_id(category->id), category->name,
                     category->archived);
        return detail::succeed(std::move(*category));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::category_state_t>
engine<StorageLibrary>::merge_category(
    const schema::merge_category_t& command) {
  using result_t = schema::category_state_t;
  return guarded<result_t>(
      "merge_category", [&]() -> schema::ledger_result<result_t> {
        if (command.from_category_id == command.into_category_id) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_argument,
              schema::ledger_entity_t::category, "into_category_id",
              "cannot merge a category into itself");
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        auto from = load_category(vault.id, command.from_category_id);
        if (!from) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "from_category_id",
                                             command.from_category_id);
        }
        auto into = load_category(vault.id, command.into_category_id);
        if (!into) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "into_category_id",
                                             command.into_category_id);
        }
        if (into->archived) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::category, "into_category_id",
              fmt::format("category '{}' is archived", into->name));
        }

        auto now = options_.now();
        auto batch = coffer::storage::write_batch_t{};
        auto moved = std::size_t{0};
        for (auto& alias : load_scoped<schema::category_alias_t>(
                 schema::key::kCategoryAliasPrefix, vault.id)) {
          if (alias.category_id != from->id) {
            continue;
          }
          alias.category_id = into->id;
          batch.put(encoder_,
                    schema::key::make_category_alias_key(vault.id, alias.alias),
                    alias);
          ++moved;
        }
        auto name_alias = schema::category_alias_t{};
        name_alias.vault_id = vault.id;
        name_alias.category_id = into->id;
        name_alias.alias = from->name;
        name_alias.created_at = now;
        batch.put(encoder_,
                  schema::key::make_category_alias_key(vault.id, from->name),
                  name_alias);

        stage_category_rewrite(batch, vault.id,
                               schema::key::fold_name(from->name), into->name);
        from->archived = true;
        batch.put(encoder_, schema::key::make_category_key(vault.id, from->id),
                  *from);
        storage_.commit(batch);
        spdlog::info("merged category '{}' into '{}' ({} aliases moved)",
                     from->name, into->name, moved);
        return detail::succeed(std::move(*into));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::category_alias_t>
engine<StorageLibrary>::create_category_alias(
    const schema::create_category_alias_t& command) {
  using result_t = schema::category_alias_t;
  return guarded<result_t>(
      "create_category_alias", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_name(command.alias,
                                       schema::ledger_entity_t::category)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto alias = trim_copy(command.alias);
        auto folded = schema::key::fold_name(alias);
        if (auto error = detail::reserved_category(folded, "alias")) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        auto category = load_category(vault.id, command.category_id);
        if (!category) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "category_id",
                                             command.category_id);
        }
        if (category->archived) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::category, "category_id",
              fmt::format("archived category '{}' cannot take aliases",
                          category->name));
        }
        if (auto error = category_name_taken(vault.id, folded, std::nullopt)) {
          return detail::fail<result_t>(std::move(*error));
        }

        auto record = result_t{};
        record.vault_id = vault.id;
        record.category_id = category->id;
        record.alias = std::move(alias);
        record.created_at = options_.now();

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_category_alias_key(vault.id, record.alias),
                  record);
        storage_.commit(batch);
        spdlog::info("'{}' now resolves to category '{}'", record.alias,
                     category->name);
        return detail::succeed(std::move(record));
      });
}

template <typename StorageLibrary>
schema::ledger_result<std::vector<schema::category_alias_t>>
engine<StorageLibrary>::list_category_aliases(
    const schema::category_alias_query_t& query) {
  using result_t = std::vector<schema::category_alias_t>;
  return guarded<result_t>(
      "list_category_aliases", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        if (!load_category(query.vault_id, query.category_id)) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "category_id", query.category_id);
        }
        auto aliases = load_scoped<schema::category_alias_t>(
            schema::key::kCategoryAliasPrefix, query.vault_id);
        std::erase_if(aliases, [&](const schema::category_alias_t& alias) {
          return alias.category_id != query.category_id;
        });
        std::ranges::sort(aliases, {}, [](const schema::category_alias_t& a) {
          return schema::key::fold_name(a.alias);
        });
        return detail::succeed(std::move(aliases));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::done_t>
engine<StorageLibrary>::delete_category_alias(
    const schema::delete_category_alias_t& command) {
  using result_t = schema::done_t;
  return guarded<result_t>(
      "delete_category_alias", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::write, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        if (!load_category(command.vault_id, command.category_id)) {
          return detail::not_found<result_t>(schema::ledger_entity_t::category,
                                             "category_id",
                                             command.category_id);
        }
        auto key = schema::key::make_category_alias_key(command.vault_id,
                                                        command.alias);
        auto alias = storage_.template get<schema::category_alias_t>(
            encoder_, detail::view(key));
        if (!alias || alias->category_id != command.category_id) {
          return detail::fail<result_t>(
              schema::ledger_error_code::not_found,
              schema::ledger_entity_t::category, "alias",
              fmt::format("'{}' is not an alias of category {}", command.alias,
                          schema::short_id(command.category_id)));
        }
        auto batch = coffer::storage::write_batch_t{};
        batch.erase(std::move(key));
        storage_.commit(batch);
        spdlog::info("removed alias '{}'", alias->alias);
        return detail::succeed(result_t{});
      });
}

// Memberships.

template <typename StorageLibrary>
schema::ledger_result<schema::vault_membership_t>
engine<StorageLibrary>::upsert_vault_membership(
    const schema::upsert_vault_membership_t& command) {
  using result_t = schema::vault_membership_t;
  return guarded<result_t>(
      "upsert_vault_membership", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_username(command.username, "username")) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::manage,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        if (command.username == vault.owner) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::membership, "username",
              "the vault owner's membership cannot be changed");
        }

        auto membership = result_t{};
        membership.vault_id = vault.id;
        membership.username = command.username;
        membership.role = command.role;
        membership.granted_by = command.actor;
        membership.granted_at = options_.now();

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_vault_member_key(vault.id,
                                                     command.username),
                  membership);
        storage_.commit(batch);
        spdlog::info("{} granted {} on vault {} to {}", command.actor,
                     schema::to_string(command.role),
                     schema::short_id(vault.id), command.username);
        return detail::succeed(std::move(membership));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::done_t>
engine<StorageLibrary>::remove_vault_membership(
    const schema::remove_vault_membership_t& command) {
  using result_t = schema::done_t;
  return guarded<result_t>(
      "remove_vault_membership", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_username(command.username, "username")) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::manage,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        if (command.username == vault.owner) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::membership, "username",
              "the vault owner cannot be removed");
        }

        auto key =
            schema::key::make_vault_member_key(vault.id, command.username);
        if (!storage_.get(detail::view(key))) {
          return detail::fail<result_t>(
              schema::ledger_error_code::not_found,
              schema::ledger_entity_t::membership, "username",
              fmt::format("{} is not a member of vault {}", command.username,
                          schema::short_id(vault.id)));
        }
        auto batch = coffer::storage::write_batch_t{};
        batch.erase(std::move(key));
        storage_.commit(batch);
        spdlog::info("{} removed {} from vault {}", command.actor,
                     command.username, schema::short_id(vault.id));
        return detail::succeed(result_t{});
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::flow_membership_t>
engine<StorageLibrary>::upsert_flow_membership(
    const schema::upsert_flow_membership_t& command) {
  using result_t = schema::flow_membership_t;
  return guarded<result_t>(
      "upsert_flow_membership", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_username(command.username, "username")) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::manage,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        if (command.username == vault.owner) {
          return detail::fail<result_t>(
              schema::ledger_error_code::invalid_state,
              schema::ledger_entity_t::membership, "username",
              "the vault owner already holds every capability");
        }
        if (!load_flow(vault.id, command.flow_id)) {
          return detail::not_found<result_t>(schema::ledger_entity_t::cash_flow,
                                             "flow_id", command.flow_id);
        }

        auto membership = result_t{};
        membership.vault_id = vault.id;
        membership.flow_id = command.flow_id;
        membership.username = command.username;
        membership.role = command.role;
        membership.granted_by = command.actor;
        membership.granted_at = options_.now();

        auto batch = coffer::storage::write_batch_t{};
        batch.put(encoder_,
                  schema::key::make_flow_member_key(vault.id, command.flow_id,
                                                    command.username),
                  membership);
        storage_.commit(batch);
        spdlog::info("{} granted {} on cash flow {} to {}", command.actor,
                     schema::to_string(command.role),
                     schema::short_id(command.flow_id), command.username);
        return detail::succeed(std::move(membership));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::done_t>
engine<StorageLibrary>::remove_flow_membership(
    const schema::remove_flow_membership_t& command) {
  using result_t = schema::done_t;
  return guarded<result_t>(
      "remove_flow_membership", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_username(command.username, "username")) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = capability_t::manage,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;

        auto key = schema::key::make_flow_member_key(vault.id, command.flow_id,
                                                     command.username);
        if (!storage_.get(detail::view(key))) {
          return detail::fail<result_t>(
              schema::ledger_error_code::not_found,
              schema::ledger_entity_t::membership, "username",
              fmt::format("{} holds no grant on cash flow {}",
                          command.username, schema::short_id(command.flow_id)));
        }
        auto batch = coffer::storage::write_batch_t{};
        batch.erase(std::move(key));
        storage_.commit(batch);
        spdlog::info("{} removed {} from cash flow {}", command.actor,
                     command.username, schema::short_id(command.flow_id));
        return detail::succeed(result_t{});
      });
}

// Reads.

template <typename StorageLibrary>
schema::ledger_result<schema::vault_view_t> engine<StorageLibrary>::get_vault(
    const schema::vault_query_t& query) {
  using result_t = schema::vault_view_t;
  return guarded<result_t>(
      "get_vault", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto& vault = context.value->vault;
        const auto& grant = context.value->grant;

        auto view = result_t{};
        view.wallets = load_scoped<schema::wallet_state_t>(
            schema::key::kWalletKeyPrefix, vault.id);
        view.flows = load_scoped<schema::cash_flow_state_t>(
            schema::key::kFlowKeyPrefix, vault.id);
        view.members = load_scoped<schema::vault_membership_t>(
            schema::key::kVaultMemberPrefix, vault.id);
        view.flow_members = load_scoped<schema::flow_membership_t>(
            schema::key::kFlowMemberPrefix, vault.id);
        view.vault = std::move(vault);

        if (grant.scope == access_scope_t::flow) {
          auto granted = [&](const schema::flow_id_t& id) {
            return std::ranges::find(grant.flows, id) != std::end(grant.flows);
          };
          view.wallets.clear();
          view.members.clear();
          std::erase_if(view.flows, [&](const schema::cash_flow_state_t& flow) {
            return !granted(flow.id);
          });
          std::erase_if(view.flow_members,
                        [&](const schema::flow_membership_t& member) {
                          return !granted(member.flow_id);
                        });
        }
        return detail::succeed(std::move(view));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::wallet_state_t>
engine<StorageLibrary>::get_wallet(const schema::wallet_query_t& query) {
  using result_t = schema::wallet_state_t;
  return guarded<result_t>(
      "get_wallet", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::view,
                             .targets = {schema::wallet_target_t{
                                 .wallet_id = query.wallet_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto wallet = load_wallet(query.vault_id, query.wallet_id);
        if (!wallet) {
          return detail::not_found<result_t>(schema::ledger_entity_t::wallet,
                                             "wallet_id", query.wallet_id);
        }
        return detail::succeed(std::move(*wallet));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::cash_flow_state_t>
engine<StorageLibrary>::get_cash_flow(const schema::cash_flow_query_t& query) {
  using result_t = schema::cash_flow_state_t;
  return guarded<result_t>(
      "get_cash_flow", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{
                .capability = capability_t::view,
                .targets = {schema::flow_target_t{.flow_id = query.flow_id}}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto flow = load_flow(query.vault_id, query.flow_id);
        if (!flow) {
          return detail::not_found<result_t>(schema::ledger_entity_t::cash_flow,
                                             "flow_id", query.flow_id);
        }
        return detail::succeed(std::move(*flow));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_record_t>
engine<StorageLibrary>::get_transaction(
    const schema::transaction_query_t& query) {
  using result_t = schema::transaction_record_t;
  return guarded<result_t>(
      "get_transaction", [&]() -> schema::ledger_result<result_t> {
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::view, .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        auto record = load_transaction(query.vault_id, query.transaction_id);
        if (!record) {
          return detail::not_found<result_t>(
              schema::ledger_entity_t::transaction, "transaction_id",
              query.transaction_id);
        }
        auto grant = authorize_actor(
            context.value->vault, query.actor,
            access_request_t{.capability = capability_t::view,
                             .targets = participants_of(record->legs)});
        if (!grant.ok()) {
          return detail::forward_error<result_t>(grant);
        }
        return detail::succeed(std::move(*record));
      });
}

template <typename StorageLibrary>
schema::ledger_result<std::vector<schema::transaction_record_t>>
engine<StorageLibrary>::select_transactions(
    const schema::transaction_filter_t& filter) {
  using result_t = std::vector<schema::transaction_record_t>;
  if (auto error = validate_window(filter.from, filter.to)) {
    return detail::fail<result_t>(std::move(*error));
  }
  if (filter.kinds && filter.kinds->empty()) {
    return detail::fail<result_t>(
        schema::ledger_error_code::invalid_argument,
        schema::ledger_entity_t::transaction, "kinds",
        "kind filter must name at least one kind");
  }
  if (filter.limit == 0) {
    return detail::fail<result_t>(schema::ledger_error_code::invalid_argument,
                                  schema::ledger_entity_t::transaction,
                                  "limit", "limit must be positive");
  }
  auto cursor = std::optional<schema::key::transaction_cursor_t>{};
  if (filter.cursor) {
    cursor = schema::key::try_parse_transaction_cursor(*filter.cursor);
    if (!cursor) {
      return detail::fail<result_t>(
          schema::ledger_error_code::invalid_argument,
          schema::ledger_entity_t::transaction, "cursor",
          fmt::format("malformed cursor '{}'", *filter.cursor));
    }
  }

  auto request =
      access_request_t{.capability = capability_t::view, .targets = {}};
  if (filter.target) {
    request.targets.push_back(*filter.target);
  }
  auto context = open_vault(filter.actor, filter.vault_id, request);
  if (!context.ok()) {
    return detail::forward_error<result_t>(context);
  }
  const auto& grant = context.value->grant;

  auto touches = [](const schema::transaction_record_t& record,
                    const schema::leg_target_t& target) {
    return std::ranges::any_of(record.legs, [&](const schema::leg_t& leg) {
      return leg.target == target;
    });
  };
  auto visible = [&](const schema::transaction_record_t& record) {
    if (grant.scope == access_scope_t::vault) {
      return true;
    }
    return std::ranges::any_of(
        grant.flows, [&](const schema::flow_id_t& flow_id) {
          return touches(record, schema::flow_target_t{.flow_id = flow_id});
        });
  };
  // Pages run newest first, so a continuation keeps what sorts after the
  // cursor: strictly older, or equally old with a lower sequence.
  auto after_cursor = [&](const schema::transaction_record_t& record) {
    return !cursor || std::pair{record.occurred_at, record.sequence} <
                          std::pair{cursor->occurred_at, cursor->sequence};
  };

  auto records = load_scoped<schema::transaction_record_t>(
      schema::key::kTransactionKeyPrefix, filter.vault_id);
  std::erase_if(records, [&](const schema::transaction_record_t& record) {
    if (!filter.include_voided && !schema::is_posted(record)) {
      return true;
    }
    auto kind = schema::kind_of(record);
    if (filter.kinds) {
      if (std::ranges::find(*filter.kinds, kind) == std::end(*filter.kinds)) {
        return true;
      }
    } else if (schema::is_transfer(kind) && !filter.include_transfers) {
      return true;
    }
    if (!in_window(record.occurred_at, filter.from, filter.to)) {
      return true;
    }
    if (filter.target && !touches(record, *filter.target)) {
      return true;
    }
    return !visible(record) || !after_cursor(record);
  });

  std::ranges::sort(records, [](const auto& lhs, const auto& rhs) {
    if (lhs.occurred_at != rhs.occurred_at) {
      return lhs.occurred_at > rhs.occurred_at;
    }
    return lhs.sequence > rhs.sequence;
  });
  return detail::succeed(std::move(records));
}

template <typename StorageLibrary>
schema::ledger_result<std::vector<schema::transaction_record_t>>
engine<StorageLibrary>::list_transactions(
    const schema::transaction_filter_t& filter) {
  using result_t = std::vector<schema::transaction_record_t>;
  return guarded<result_t>(
      "list_transactions", [&]() -> schema::ledger_result<result_t> {
        auto records = select_transactions(filter);
        if (records.ok() && records.value->size() > filter.limit) {
          records.value->resize(filter.limit);
        }
        return records;
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::transaction_page_t>
engine<StorageLibrary>::list_transactions_page(
    const schema::transaction_filter_t& filter) {
  using result_t = schema::transaction_page_t;
  return guarded<result_t>(
      "list_transactions_page", [&]() -> schema::ledger_result<result_t> {
        auto records = select_transactions(filter);
        if (!records.ok()) {
          return detail::forward_error<result_t>(records);
        }
        auto page = result_t{};
        page.records = std::move(*records.value);
        if (page.records.size() > filter.limit) {
          page.records.resize(filter.limit);
          const auto& last = page.records.back();
          page.next_cursor =
              schema::key::make_transaction_cursor(last.occurred_at,
                                                   last.sequence);
        }
        return detail::succeed(std::move(page));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::statistics_t>
engine<StorageLibrary>::get_statistics(
    const schema::statistics_query_t& query) {
  using result_t = schema::statistics_t;
  return guarded<result_t>(
      "get_statistics", [&]() -> schema::ledger_result<result_t> {
        if (auto error = validate_window(query.from, query.to)) {
          return detail::fail<result_t>(std::move(*error));
        }
        auto context = open_vault(
            query.actor, query.vault_id,
            access_request_t{.capability = capability_t::report,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;
        return detail::succeed(aggregate_statistics(
            vault,
            load_scoped<schema::wallet_state_t>(schema::key::kWalletKeyPrefix,
                                                vault.id),
            load_scoped<schema::cash_flow_state_t>(schema::key::kFlowKeyPrefix,
                                                   vault.id),
            load_scoped<schema::transaction_record_t>(
                schema::key::kTransactionKeyPrefix, vault.id),
            query.from, query.to));
      });
}

template <typename StorageLibrary>
schema::ledger_result<schema::balance_report_t>
engine<StorageLibrary>::verify_balances(
    const schema::verify_balances_t& command) {
  using result_t = schema::balance_report_t;
  return guarded<result_t>(
      "verify_balances", [&]() -> schema::ledger_result<result_t> {
        auto vault_lock = locks_.acquire(command.vault_id);
        auto context = open_vault(
            command.actor, command.vault_id,
            access_request_t{.capability = command.repair
                                               ? capability_t::manage
                                               : capability_t::report,
                             .targets = {}});
        if (!context.ok()) {
          return detail::forward_error<result_t>(context);
        }
        const auto& vault = context.value->vault;

        auto balances = balance_set_t{};
        for (auto& wallet : load_scoped<schema::wallet_state_t>(
                 schema::key::kWalletKeyPrefix, vault.id)) {
          balances.wallets.emplace(wallet.id, std::move(wallet));
        }
        for (auto& flow : load_scoped<schema::cash_flow_state_t>(
                 schema::key::kFlowKeyPrefix, vault.id)) {
          balances.flows.emplace(flow.id, std::move(flow));
        }
        auto expected = replay_balances(
            load_scoped<schema::transaction_record_t>(
                schema::key::kTransactionKeyPrefix, vault.id),
            vault.currency);
        auto expected_for = [&](const schema::leg_target_t& target) {
          auto it = expected.find(target);
          return it == std::end(expected) ? schema::amount_minor_t{0}
                                          : it->second;
        };

        auto report = result_t{};
        report.vault_id = vault.id;
        report.currency = vault.currency;
        auto repaired = balance_set_t{};
        for (const auto& [id, wallet] : balances.wallets) {
          auto target = schema::leg_target_t{schema::wallet_target_t{.wallet_id = id}};
          auto entry = schema::balance_entry_t{.target = target,
                                               .name = wallet.name,
                                               .stored = wallet.balance,
                                               .expected = expected_for(target)};
          if (entry.drifted()) {
            ++report.drifted;
            auto fixed = wallet;
            fixed.balance = entry.expected;
            repaired.wallets.emplace(id, std::move(fixed));
          }
          report.entries.push_back(std::move(entry));
        }
        for (const auto& [id, flow] : balances.flows) {
          auto target = schema::leg_target_t{schema::flow_target_t{.flow_id = id}};
          auto entry = schema::balance_entry_t{.target = target,
                                               .name = flow.name,
                                               .stored = flow.balance,
                                               .expected = expected_for(target)};
          if (entry.drifted()) {
            ++report.drifted;
            auto fixed = flow;
            fixed.balance = entry.expected;
            repaired.flows.emplace(id, std::move(fixed));
          }
          report.entries.push_back(std::move(entry));
        }

        if (report.drifted > 0) {
          spdlog::warn("vault {} has {} drifted balances",
                       schema::short_id(vault.id), report.drifted);
        }
        if (command.repair && report.drifted > 0) {
          auto batch = coffer::storage::write_batch_t{};
          stage_balances(batch, repaired);
          storage_.commit(batch);
          report.repaired = true;
          spdlog::info("repaired {} balances in vault {}", report.drifted,
                       schema::short_id(vault.id));
        }
        return detail::succeed(std::move(report));
      });
}

template class engine<coffer::storage::memory_storage_tag>;
template class engine<coffer::storage::rocksdb_storage_tag>;

}  // namespace coffer::ledger
