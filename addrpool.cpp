// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include "addrpool.hpp"

namespace ba = boost::asio;

AddrPool::AddrPool(const ba::ip::address_v4 &lo, const ba::ip::address_v4 &hi,
                   const std::set<ba::ip::address_v4> &excluded)
{
    // 64-bit counter so that a range ending at 255.255.255.255 terminates.
    for (uint64_t i = lo.to_uint(), iend = hi.to_uint(); i <= iend; ++i) {
        const ba::ip::address_v4 a(static_cast<uint32_t>(i));
        if (excluded.count(a)) continue;
        free_.push_back(a);
        members_.insert(a.to_uint());
    }
}

std::optional<ba::ip::address_v4> AddrPool::take()
{
    if (free_.empty()) return {};
    const auto a = free_.front();
    free_.pop_front();
    members_.erase(a.to_uint());
    return a;
}

bool AddrPool::release(const ba::ip::address_v4 &addr)
{
    if (!members_.insert(addr.to_uint()).second) return false;
    free_.push_back(addr);
    return true;
}
