#pragma once
#include <coffer/schema/primitives.hpp>

#include <variant>
#include <vector>

// Schema type: leg.
// One signed balance change on one wallet or cash flow. Every balance change
// in a vault is the application (or, on void, the inversion) of a leg.
namespace coffer::schema {

struct wallet_target_t final {
  wallet_id_t wallet_id{};

  bool operator==(const wallet_target_t&) const = default;
  auto operator<=>(const wallet_target_t&) const = default;
};

struct flow_target_t final {
  flow_id_t flow_id{};

  bool operator==(const flow_target_t&) const = default;
  auto operator<=>(const flow_target_t&) const = default;
};

using leg_target_t = std::variant<wallet_target_t, flow_target_t>;

template <uint16_t Version>
struct leg;

template <>
struct leg<1> final {
  leg_target_t target{};
  amount_minor_t amount{};

  bool operator==(const leg<1>&) const = default;
};

using leg_t = leg<1>;

inline bool is_wallet_target(const leg_target_t& target) {
  return std::holds_alternative<wallet_target_t>(target);
}

inline const hash32_t& target_id(const leg_target_t& target) {
  return std::visit(
      overloaded{[](const wallet_target_t& value) -> const hash32_t& {
                   return value.wallet_id;
                 },
                 [](const flow_target_t& value) -> const hash32_t& {
                   return value.flow_id;
                 }},
      target);
}

}  // namespace coffer::schema
