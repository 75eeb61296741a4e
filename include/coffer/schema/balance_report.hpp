#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/leg.hpp>
#include <coffer/schema/primitives.hpp>

#include <string>
#include <vector>

namespace coffer::schema {

struct balance_entry_t final {
  leg_target_t target{};
  std::string name;
  amount_minor_t stored{};
  amount_minor_t expected{};

  bool drifted() const { return stored != expected; }
};

template <uint16_t Version>
struct balance_report;

template <>
struct balance_report<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  currency_t currency{currency_t::eur};
  std::vector<balance_entry_t> entries;
  uint64_t drifted{};
  bool repaired{false};
};

using balance_report_t = balance_report<1>;

}  // namespace coffer::schema
