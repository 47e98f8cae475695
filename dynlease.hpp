// Copyright 2016-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_DYNLEASE_HPP_
#define LEASEKEEP_DYNLEASE_HPP_

#include <stdint.h>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <boost/asio/ip/address_v4.hpp>
#include "addrpool.hpp"
#include "cfg.hpp"

enum class ResolveStatus
{
    Ok,
    PoolExhausted,
    ReservedAddressInvalid,
};
const char *resolve_status_str(ResolveStatus s);

// A lease is active while now < expire_time.
struct lease_state_v4
{
    lease_state_v4(const boost::asio::ip::address_v4 &addr_, int64_t et, uint64_t seq_)
        : addr(addr_), expire_time(et), seq(seq_) {}
    boost::asio::ip::address_v4 addr;
    int64_t expire_time;
    uint64_t seq; // creation order
};

struct dynlease_stats
{
    size_t free;
    size_t active;
    size_t reserved;
    size_t records;
};

// Owns the free address pool and the lease table for one subnet.  Every
// public member takes the same lock for its whole duration.
class DynLease4
{
public:
    // Returns seconds on a monotonic clock.
    using clock_fn = std::function<int64_t()>;

    explicit DynLease4(const subnet_config &cfg, clock_fn now = clock_fn{});
    DynLease4(const DynLease4 &) = delete;
    DynLease4 &operator=(const DynLease4 &) = delete;

    // Chooses the address for hwaddr, which must be in canonical form.
    // Reservations win, then the client's previous address, then the
    // head of the free pool after expired leases are reclaimed.
    [[nodiscard]] ResolveStatus resolve(const std::string &hwaddr,
                                        boost::asio::ip::address_v4 &out);
    // Returns the client's dynamic address to the pool.  Reserved
    // bindings are not affected.
    bool release(const std::string &hwaddr);
    // Reclaims every expired dynamic lease; returns how many addresses
    // went back to the pool.
    size_t sweep();
    std::optional<lease_state_v4> lookup(const std::string &hwaddr) const;
    dynlease_stats stats() const;
private:
    bool held_by_other(const std::string &hwaddr, const boost::asio::ip::address_v4 &addr,
                       int64_t now) const;
    bool is_reserved_addr(const boost::asio::ip::address_v4 &addr) const
    {
        return reserved_addrs_.count(addr) != 0;
    }
    size_t reclaim_expired(int64_t now);

    const subnet_config cfg_;
    clock_fn now_;
    const std::set<boost::asio::ip::address_v4> reserved_addrs_;
    mutable std::mutex mtx_;
    AddrPool pool_;
    std::unordered_map<std::string, lease_state_v4> leases_;
    uint64_t next_seq_;
};

#endif
