// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_MACSTR_HPP_
#define LEASEKEEP_MACSTR_HPP_

#include <stdint.h>
#include <string>
#include <string_view>

// Canonical form is six lowercase hex octets joined by ':'.
std::string macraw_to_str(const uint8_t *macraw);
bool is_macstr(std::string_view ms);
// Accepts ':' or '-' separators in either case.
[[nodiscard]] bool macstr_canonical(std::string_view ms, std::string &out);
[[nodiscard]] bool macstr_to_raw(std::string_view ms, uint8_t *macraw);

#endif
