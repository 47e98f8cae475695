// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <ctype.h>
#include <stdio.h>
#include "macstr.hpp"

std::string macraw_to_str(const uint8_t *macraw)
{
    char buf[32];
    snprintf(buf, sizeof buf, "%.2hhx:%.2hhx:%.2hhx:%.2hhx:%.2hhx:%.2hhx",
             macraw[0], macraw[1], macraw[2], macraw[3], macraw[4], macraw[5]);
    return std::string(buf);
}

static bool is_macsep(char c, char sep)
{
    return c == sep && (sep == ':' || sep == '-');
}

bool is_macstr(std::string_view ms)
{
    if (ms.size() != 17) return false;
    const auto sep = ms[2];
    for (size_t i = 0; i < 17; ++i) {
        if (i % 3 == 2) {
            if (!is_macsep(ms[i], sep)) return false;
        } else if (!isxdigit(static_cast<unsigned char>(ms[i]))) {
            return false;
        }
    }
    return true;
}

static uint8_t hexval(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return 10 + (c - 'A');
}

bool macstr_to_raw(std::string_view ms, uint8_t *macraw)
{
    if (!is_macstr(ms)) return false;
    for (size_t i = 0; i < 6; ++i)
        macraw[i] = (hexval(ms[3*i]) << 4) | hexval(ms[3*i + 1]);
    return true;
}

bool macstr_canonical(std::string_view ms, std::string &out)
{
    uint8_t raw[6];
    if (!macstr_to_raw(ms, raw)) return false;
    out = macraw_to_str(raw);
    return true;
}
