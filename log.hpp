// Copyright 2003-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_LOG_HPP_
#define LEASEKEEP_LOG_HPP_

#include <stdlib.h>
#include <syslog.h>
#include <string>
#include <fmt/printf.h>

// Messages go to stderr until log_set_daemon() switches them to syslog.
void log_set_daemon();
void log_set_quiet(bool quiet);
void log_write(int prio, const std::string &msg);

#define log_line(...) do { \
    log_write(LOG_INFO, fmt::sprintf(__VA_ARGS__)); \
    } while (0)

#define log_warning(...) do { \
    log_write(LOG_WARNING, fmt::sprintf(__VA_ARGS__)); \
    } while (0)

#define log_error(...) do { \
    log_write(LOG_ERR, fmt::sprintf(__VA_ARGS__)); \
    } while (0)

#define suicide(...) do { \
    log_write(LOG_CRIT, fmt::sprintf(__VA_ARGS__)); \
    exit(EXIT_FAILURE); } while (0)

#endif
