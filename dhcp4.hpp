// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_DHCP4_HPP_
#define LEASEKEEP_DHCP4_HPP_

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/ip/address_v4.hpp>
#include "cfg.hpp"
#include "dynlease.hpp"

// Message type option values, cf. RFC 2132 9.6
enum {
    DHCPDISCOVER = 1,
    DHCPOFFER    = 2,
    DHCPREQUEST  = 3,
    DHCPACK      = 5,
    DHCPRELEASE  = 7,
};

enum class RequestKind { Discover, Request, Release };

// What the packet layer needs to encode an OFFER or ACK.
struct d4_reply
{
    uint8_t type;
    std::string hwaddr;
    boost::asio::ip::address_v4 yiaddr;
    boost::asio::ip::address_v4 subnet_mask;
    uint32_t lease_time;
    std::optional<boost::asio::ip::address_v4> router;
    std::vector<boost::asio::ip::address_v4> dns_servers;
};

std::string d4_reply_str(const d4_reply &r);

// Turns decoded client messages into replies.  DISCOVER and REQUEST are
// resolved identically; a REQUEST for an address other than the one
// resolve() picks is not NAKed.  An empty result means no reply is sent.
class D4Handler
{
public:
    D4Handler(const subnet_config &cfg, DynLease4 &leases) : cfg_(cfg), leases_(leases) {}
    D4Handler(const D4Handler &) = delete;
    D4Handler &operator=(const D4Handler &) = delete;

    // hwaddr must be exactly 6 bytes
    std::optional<d4_reply> process(const uint8_t *hwaddr, RequestKind kind);
    std::optional<d4_reply> process(const std::string &hwaddr, RequestKind kind);
private:
    std::optional<d4_reply> create_reply(const std::string &hwaddr, uint8_t type);
    std::optional<d4_reply> reply_discover(const std::string &hwaddr);
    std::optional<d4_reply> reply_request(const std::string &hwaddr);
    void do_release(const std::string &hwaddr);

    const subnet_config &cfg_;
    DynLease4 &leases_;
};

#endif
