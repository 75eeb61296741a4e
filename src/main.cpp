#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <coffer/ledger/engine.hpp>
#include <coffer/schema/encoding/scale/encoder.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace po = boost::program_options;

using engine_t = coffer::ledger::engine<coffer::storage::rocksdb_storage_tag>;

struct admin_settings final {
  std::string db_path;
  std::string config_path;
  std::string log_level;
  std::string log_file;
  std::string deletion_policy;
  std::string default_currency;
  std::string default_wallet;
  std::string command;
  std::string actor;
  std::string name;
  std::string vault_id;
  std::string currency;
  std::optional<uint64_t> from;
  std::optional<uint64_t> to;
  bool repair{false};
};

void configure_logging(const admin_settings& settings) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!settings.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        settings.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "coffer", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(settings.log_level));
}

coffer::ledger::engine_options make_engine_options(
    const admin_settings& settings) {
  auto options = coffer::ledger::engine_options{};
  auto policy = coffer::schema::try_from_string<
      coffer::ledger::vault_deletion_policy_t>(settings.deletion_policy);
  if (!policy) {
    throw po::error{
        fmt::format("unknown deletion policy '{}'", settings.deletion_policy)};
  }
  options.deletion_policy = *policy;

  auto currency = coffer::schema::try_from_string<coffer::schema::currency_t>(
      settings.default_currency);
  if (!currency) {
    throw po::error{
        fmt::format("unknown currency '{}'", settings.default_currency)};
  }
  options.default_currency = *currency;
  options.default_wallet_name = settings.default_wallet;
  return options;
}

coffer::schema::vault_id_t require_vault_id(const admin_settings& settings) {
  auto vault_id = coffer::schema::try_make_hash32(settings.vault_id);
  if (!vault_id) {
    throw po::error{"--vault-id must be 64 hex characters"};
  }
  return *vault_id;
}

int report_error(const coffer::schema::ledger_error_t& error) {
  fmt::print(stderr, "error: {} ({}.{}): {}\n",
             coffer::schema::to_string(error.code),
             coffer::schema::to_string(error.entity), error.field,
             error.message);
  return 2;
}

std::string format_minor(coffer::schema::amount_minor_t minor,
                         coffer::schema::currency_t currency) {
  return coffer::schema::money_t{minor, currency}.format();
}

void print_vault(const coffer::schema::vault_view_t& view) {
  const auto& vault = view.vault;
  fmt::print("vault {} '{}' owner={} currency={}\n",
             coffer::schema::to_hex(vault.id), vault.name, vault.owner,
             coffer::schema::to_string(vault.currency));
  for (const auto& wallet : view.wallets) {
    fmt::print("  wallet {} {:<24} {:>16}{}\n",
               coffer::schema::short_id(wallet.id), wallet.name,
               format_minor(wallet.balance, wallet.currency),
               wallet.archived ? " (archived)" : "");
  }
  for (const auto& flow : view.flows) {
    fmt::print("  flow   {} {:<24} {:>16}{}\n",
               coffer::schema::short_id(flow.id), flow.name,
               format_minor(flow.balance, flow.currency),
               flow.archived ? " (archived)" : "");
  }
  for (const auto& member : view.members) {
    fmt::print("  member {} ({})\n", member.username,
               coffer::schema::to_string(member.role));
  }
  for (const auto& member : view.flow_members) {
    fmt::print("  flow member {} on {} ({})\n", member.username,
               coffer::schema::short_id(member.flow_id),
               coffer::schema::to_string(member.role));
  }
}

void print_statistics(const coffer::schema::statistics_t& stats) {
  fmt::print("vault {} ({} transactions)\n",
             coffer::schema::short_id(stats.vault_id),
             stats.transaction_count);
  fmt::print("  balance      {:>16}\n",
             format_minor(stats.balance_total, stats.currency));
  fmt::print("  income       {:>16}\n",
             format_minor(stats.income_total, stats.currency));
  fmt::print("  expense      {:>16}\n",
             format_minor(stats.expense_total, stats.currency));
  fmt::print("  refunds      {:>16}\n",
             format_minor(stats.refund_total, stats.currency));
  fmt::print("  net expense  {:>16}\n",
             format_minor(stats.net_expense_total, stats.currency));
  auto print_totals = [&](std::string_view label, const auto& totals) {
    for (const auto& entry : totals) {
      fmt::print("  {} {:<24} +{} -{} = {}\n", label, entry.name,
                 format_minor(entry.credits, stats.currency),
                 format_minor(entry.debits, stats.currency),
                 format_minor(entry.net, stats.currency));
    }
  };
  print_totals("wallet", stats.wallets);
  print_totals("flow  ", stats.flows);
}

void print_report(const coffer::schema::balance_report_t& report) {
  for (const auto& entry : report.entries) {
    fmt::print("  {} {:<24} stored {:>16} expected {:>16}{}\n",
               coffer::schema::is_wallet_target(entry.target) ? "wallet"
                                                              : "flow  ",
               entry.name, format_minor(entry.stored, report.currency),
               format_minor(entry.expected, report.currency),
               entry.drifted() ? "  DRIFT" : "");
  }
  fmt::print("{} drifted, {}\n", report.drifted,
             report.repaired ? "repaired" : "not repaired");
}

int run(engine_t& engine, const admin_settings& settings) {
  if (settings.command == "create-vault") {
    auto command = coffer::schema::create_vault_t{};
    command.actor = settings.actor;
    command.name = settings.name;
    if (!settings.currency.empty()) {
      command.currency =
          coffer::schema::try_from_string<coffer::schema::currency_t>(
              settings.currency);
      if (!command.currency) {
        throw po::error{fmt::format("unknown currency '{}'", settings.currency)};
      }
    }
    auto result = engine.create_vault(command);
    if (!result.ok()) {
      return report_error(*result.error);
    }
    print_vault(*result.value);
    return 0;
  }

  if (settings.command == "show-vault") {
    auto result = engine.get_vault(coffer::schema::vault_query_t{
        .actor = settings.actor, .vault_id = require_vault_id(settings)});
    if (!result.ok()) {
      return report_error(*result.error);
    }
    print_vault(*result.value);
    return 0;
  }

  if (settings.command == "stats") {
    auto query = coffer::schema::statistics_query_t{};
    query.actor = settings.actor;
    query.vault_id = require_vault_id(settings);
    query.from = settings.from;
    query.to = settings.to;
    auto result = engine.get_statistics(query);
    if (!result.ok()) {
      return report_error(*result.error);
    }
    print_statistics(*result.value);
    return 0;
  }

  if (settings.command == "verify") {
    auto result = engine.verify_balances(coffer::schema::verify_balances_t{
        .actor = settings.actor,
        .vault_id = require_vault_id(settings),
        .repair = settings.repair});
    if (!result.ok()) {
      return report_error(*result.error);
    }
    print_report(*result.value);
    return result.value->drifted > 0 && !result.value->repaired ? 1 : 0;
  }

  throw po::error{fmt::format("unknown command '{}'", settings.command)};
}

}  // namespace

int main(int argc, char* argv[]) {
  auto settings = admin_settings{};

  auto generic = po::options_description{"Coffer admin"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&settings.config_path),
      "Read further options from this file");

  auto configuration = po::options_description{"Configuration"};
  configuration.add_options()(
      "db-path,d",
      po::value<std::string>(&settings.db_path)->default_value("coffer.db"),
      "RocksDB directory")(
      "log-level",
      po::value<std::string>(&settings.log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&settings.log_file),
      "Also write the log to this file")(
      "deletion-policy",
      po::value<std::string>(&settings.deletion_policy)
          ->default_value("reject"),
      "Vault deletion policy: reject or cascade")(
      "default-currency",
      po::value<std::string>(&settings.default_currency)->default_value("EUR"),
      "Currency of vaults created without one")(
      "default-wallet",
      po::value<std::string>(&settings.default_wallet)->default_value("Cash"),
      "Name of the wallet every new vault starts with");

  auto command_line = po::options_description{"Command"};
  command_line.add_options()(
      "command", po::value<std::string>(&settings.command),
      "create-vault, show-vault, stats or verify")(
      "actor,u", po::value<std::string>(&settings.actor),
      "User performing the command")(
      "name,n", po::value<std::string>(&settings.name), "Vault name")(
      "vault-id", po::value<std::string>(&settings.vault_id), "Vault id (hex)")(
      "currency", po::value<std::string>(&settings.currency),
      "Vault currency for create-vault")(
      "from", po::value<uint64_t>(), "Window start, epoch milliseconds")(
      "to", po::value<uint64_t>(), "Window end (exclusive), epoch milliseconds")(
      "repair", po::bool_switch(&settings.repair),
      "Rewrite drifted balances (verify)");

  auto all = po::options_description{};
  all.add(generic).add(configuration).add(command_line);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{settings.config_path};
      if (!file) {
        throw po::error{
            fmt::format("cannot open config file '{}'", settings.config_path)};
      }
      po::store(po::parse_config_file(file, configuration), vm);
      po::notify(vm);
    }
  } catch (const po::error& e) {
    fmt::print(stderr, "error: {}\n", e.what());
    return 64;
  }

  if (vm.contains("help") || settings.command.empty()) {
    std::cout << all << std::endl;
    return vm.contains("help") ? 0 : 64;
  }
  if (vm.contains("from")) {
    settings.from = vm["from"].as<uint64_t>();
  }
  if (vm.contains("to")) {
    settings.to = vm["to"].as<uint64_t>();
  }

  configure_logging(settings);

  auto exit_code = 0;
  try {
    auto encoder = coffer::schema::encoding::scale_encoder_t{};
    auto storage = coffer::storage::make_storage<
        coffer::storage::rocksdb_storage_tag>(settings.db_path);
    auto engine = engine_t{encoder, storage, make_engine_options(settings)};
    exit_code = run(engine, settings);
  } catch (const po::error& e) {
    fmt::print(stderr, "error: {}\n", e.what());
    exit_code = 64;
  } catch (const coffer::storage::storage_error& e) {
    spdlog::error("store unavailable: {}", e.what());
    exit_code = 3;
  }

  spdlog::shutdown();
  return exit_code;
}
