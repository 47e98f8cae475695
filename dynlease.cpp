// Copyright 2016-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <errno.h>
#include <string.h>
#include <time.h>
#include <algorithm>
#include <vector>
#include "dynlease.hpp"
#include "log.hpp"

namespace ba = boost::asio;

static int64_t get_current_ts()
{
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts))
        suicide("clock_gettime failed: %s\n", strerror(errno));
    return ts.tv_sec;
}

static std::set<ba::ip::address_v4> reserved_set(const subnet_config &cfg)
{
    std::set<ba::ip::address_v4> r;
    for (const auto &i: cfg.reserved) r.insert(i.second);
    return r;
}

const char *resolve_status_str(ResolveStatus s)
{
    switch (s) {
    case ResolveStatus::Ok: return "ok";
    case ResolveStatus::PoolExhausted: return "no available addresses";
    case ResolveStatus::ReservedAddressInvalid: return "invalid reserved address";
    }
    return "unknown";
}

DynLease4::DynLease4(const subnet_config &cfg, clock_fn now)
    : cfg_(cfg), now_(now ? std::move(now) : clock_fn(get_current_ts)),
      reserved_addrs_(reserved_set(cfg)),
      pool_(cfg.range_lo, cfg.range_hi, reserved_addrs_), next_seq_(0)
{}

bool DynLease4::held_by_other(const std::string &hwaddr, const ba::ip::address_v4 &addr,
                              int64_t now) const
{
    for (const auto &[k, v]: leases_) {
        if (v.addr == addr && now < v.expire_time && k != hwaddr)
            return true;
    }
    return false;
}

size_t DynLease4::reclaim_expired(int64_t now)
{
    using lease_iter = decltype(leases_)::iterator;
    std::vector<lease_iter> expired;
    for (auto i = leases_.begin(), iend = leases_.end(); i != iend; ++i) {
        if (i->second.expire_time <= now && !is_reserved_addr(i->second.addr))
            expired.push_back(i);
    }
    // Oldest expiry goes back to the pool first.
    std::sort(expired.begin(), expired.end(), [](const lease_iter &a, const lease_iter &b) {
        if (a->second.expire_time != b->second.expire_time)
            return a->second.expire_time < b->second.expire_time;
        return a->second.seq < b->second.seq;
    });
    size_t n = 0;
    for (auto &i: expired) {
        const auto addr = i->second.addr;
        const auto owned = held_by_other(i->first, addr, now);
        leases_.erase(i);
        if (!owned && pool_.release(addr)) ++n;
    }
    if (n) log_line("dynlease: reclaimed %zu expired addresses\n", n);
    return n;
}

ResolveStatus DynLease4::resolve(const std::string &hwaddr, ba::ip::address_v4 &out)
{
    std::lock_guard<std::mutex> lk(mtx_);
    const auto now = now_();
    const auto expire_time = now + cfg_.lease_duration;

    if (auto r = cfg_.reserved.find(hwaddr); r != cfg_.reserved.end()) {
        if (r->second.is_unspecified()) {
            log_warning("dynlease: reservation for %s has an unusable address\n", hwaddr);
            return ResolveStatus::ReservedAddressInvalid;
        }
        auto [i, inserted] = leases_.try_emplace(hwaddr, r->second, expire_time, next_seq_);
        if (inserted) {
            ++next_seq_;
        } else {
            i->second.addr = r->second;
            i->second.expire_time = expire_time;
        }
        out = r->second;
        return ResolveStatus::Ok;
    }

    if (auto i = leases_.find(hwaddr); i != leases_.end()) {
        if (!held_by_other(hwaddr, i->second.addr, now)) {
            i->second.expire_time = expire_time;
            out = i->second.addr;
            return ResolveStatus::Ok;
        }
        log_line("dynlease: %s for %s is held by another client\n",
                 i->second.addr.to_string(), hwaddr);
        leases_.erase(i);
    }

    reclaim_expired(now);

    const auto a = pool_.take();
    if (!a) return ResolveStatus::PoolExhausted;
    leases_.try_emplace(hwaddr, *a, expire_time, next_seq_++);
    out = *a;
    return ResolveStatus::Ok;
}

bool DynLease4::release(const std::string &hwaddr)
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto i = leases_.find(hwaddr);
    if (i == leases_.end() || is_reserved_addr(i->second.addr))
        return false;
    const auto addr = i->second.addr;
    const auto owned = held_by_other(hwaddr, addr, now_());
    leases_.erase(i);
    if (!owned) pool_.release(addr);
    return true;
}

size_t DynLease4::sweep()
{
    std::lock_guard<std::mutex> lk(mtx_);
    return reclaim_expired(now_());
}

std::optional<lease_state_v4> DynLease4::lookup(const std::string &hwaddr) const
{
    std::lock_guard<std::mutex> lk(mtx_);
    auto i = leases_.find(hwaddr);
    if (i == leases_.end()) return {};
    return i->second;
}

dynlease_stats DynLease4::stats() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    const auto now = now_();
    dynlease_stats r{pool_.size(), 0, 0, leases_.size()};
    for (const auto &i: leases_) {
        if (now >= i.second.expire_time) continue;
        if (is_reserved_addr(i.second.addr)) ++r.reserved;
        else ++r.active;
    }
    return r;
}
