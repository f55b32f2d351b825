#pragma once

#include <swapguard/schema/swap_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(swapguard::schema,
                             swap_status_t,
                             swapguard::schema::swap_status_t::pending,
                             swapguard::schema::swap_status_t::settled,
                             swapguard::schema::swap_status_t::aborted)
