#ifndef LEASEKEEP_PARSEHELP_H_
#define LEASEKEEP_PARSEHELP_H_

#include <string>
#include <charconv>

static inline char parsehelp_lc(char c)
{
    if (c >= 'A' && c <= 'Z') return 'a' + (c - 'A');
    return c;
}

static inline void lc_string_inplace(std::string &s)
{
    for (auto &c: s) c = parsehelp_lc(c);
}

// Whole of [start, end) must be a decimal that fits in T.
template <typename T>
static inline bool parse_decimal(T &out, const char *start, const char *end)
{
    if (start >= end) return false;
    const auto r = std::from_chars(start, end, out, 10);
    return r.ec == std::errc() && r.ptr == end;
}

#endif
