#pragma once
#include <coffer/schema/currency.hpp>
#include <coffer/schema/membership_role.hpp>
#include <coffer/schema/transaction_state.hpp>

#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(coffer::schema,
                             currency_t,
                             coffer::schema::currency_t::eur,
                             coffer::schema::currency_t::usd,
                             coffer::schema::currency_t::gbp,
                             coffer::schema::currency_t::chf,
                             coffer::schema::currency_t::jpy)

SCALE_DEFINE_ENUM_VALUE_LIST(coffer::schema,
                             membership_role_t,
                             coffer::schema::membership_role_t::owner,
                             coffer::schema::membership_role_t::editor,
                             coffer::schema::membership_role_t::viewer)

SCALE_DEFINE_ENUM_VALUE_LIST(coffer::schema,
                             transaction_state_t,
                             coffer::schema::transaction_state_t::posted,
                             coffer::schema::transaction_state_t::voided)
