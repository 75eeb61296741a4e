#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/enum_string.hpp>
#include <coffer/schema/primitives.hpp>

#include <array>
#include <optional>
#include <string_view>

// Schema type: cash flow state.
// Budget bucket whose running total is independent of wallet balances.
// max_balance caps the flow; with income_balance also set the cap applies to
// the cumulative positive legs instead of the running balance.
namespace coffer::schema {

enum class cash_flow_mode_t : uint8_t {
  unlimited = 0,
  net_capped = 1,
  income_capped = 2
};

inline constexpr auto kCashFlowModeMappings = std::array{
    std::pair<std::string_view, cash_flow_mode_t>{"unlimited",
                                                  cash_flow_mode_t::unlimited},
    std::pair<std::string_view, cash_flow_mode_t>{
        "net_capped", cash_flow_mode_t::net_capped},
    std::pair<std::string_view, cash_flow_mode_t>{
        "income_capped", cash_flow_mode_t::income_capped}};

template <>
inline std::optional<cash_flow_mode_t> try_from_string<cash_flow_mode_t>(
    const std::string_view value) {
  return from_string(value, kCashFlowModeMappings);
}

inline constexpr std::string_view to_string(const cash_flow_mode_t value) {
  return to_string(value, kCashFlowModeMappings).value_or("unknown");
}

template <uint16_t Version>
struct cash_flow_state;

template <>
struct cash_flow_state<1> final {
  uint16_t version{1};
  flow_id_t id{};
  vault_id_t vault_id{};
  std::string name;
  amount_minor_t balance{};
  currency_t currency{currency_t::eur};
  bool archived{false};
  timestamp_milliseconds_t created_at{};
  std::optional<amount_minor_t> max_balance;
  std::optional<amount_minor_t> income_balance;
};

using cash_flow_state_t = cash_flow_state<1>;

inline cash_flow_mode_t mode_of(const cash_flow_state_t& flow) {
  if (!flow.max_balance) {
    return cash_flow_mode_t::unlimited;
  }
  return flow.income_balance ? cash_flow_mode_t::income_capped
                             : cash_flow_mode_t::net_capped;
}

}  // namespace coffer::schema
