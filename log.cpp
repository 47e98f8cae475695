// Copyright 2003-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <stdio.h>
#include <atomic>
#include "log.hpp"

static std::atomic<bool> log_to_syslog{false};
static std::atomic<bool> log_quiet{false};

void log_set_daemon()
{
    openlog("leasekeep", LOG_PID, LOG_DAEMON);
    log_to_syslog = true;
}

void log_set_quiet(bool quiet)
{
    log_quiet = quiet;
}

void log_write(int prio, const std::string &msg)
{
    if (log_quiet) return;
    if (log_to_syslog) {
        syslog(prio, "%s", msg.c_str());
        return;
    }
    // One fputs per message keeps lines from interleaving across threads.
    fputs(msg.c_str(), stderr);
}
