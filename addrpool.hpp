// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_ADDRPOOL_HPP_
#define LEASEKEEP_ADDRPOOL_HPP_

#include <stdint.h>
#include <deque>
#include <optional>
#include <set>
#include <unordered_set>
#include <boost/asio/ip/address_v4.hpp>

// Free dynamic addresses.  take() pops the head and release() appends
// to the tail, so a reclaimed address is handed out only after every
// address that was freed before it.
class AddrPool
{
public:
    AddrPool(const boost::asio::ip::address_v4 &lo, const boost::asio::ip::address_v4 &hi,
             const std::set<boost::asio::ip::address_v4> &excluded);
    AddrPool(const AddrPool &) = delete;
    AddrPool &operator=(const AddrPool &) = delete;

    [[nodiscard]] std::optional<boost::asio::ip::address_v4> take();
    // Refuses addresses that are already free.
    bool release(const boost::asio::ip::address_v4 &addr);
    bool contains(const boost::asio::ip::address_v4 &addr) const
    {
        return members_.count(addr.to_uint()) != 0;
    }
    size_t size() const { return free_.size(); }
    bool empty() const { return free_.empty(); }
private:
    std::deque<boost::asio::ip::address_v4> free_;
    std::unordered_set<uint32_t> members_;
};

#endif
