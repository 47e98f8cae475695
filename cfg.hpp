// Copyright 2016-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#ifndef LEASEKEEP_CFG_HPP_
#define LEASEKEEP_CFG_HPP_

#include <stdint.h>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>

#define LEASEKEEP_DEFAULT_INTERFACE "en5"
// Bounds memory used by the free address pool.
#define LEASEKEEP_MAX_RANGE_SIZE (1u << 20)

struct subnet_config
{
    std::string interface;
    boost::asio::ip::network_v4 network;
    boost::asio::ip::address_v4 range_lo;
    boost::asio::ip::address_v4 range_hi;
    uint32_t lease_duration = 0; // seconds
    std::optional<boost::asio::ip::address_v4> gateway;
    std::vector<boost::asio::ip::address_v4> dns_servers;
    // Keyed by canonical (lowercase, ':' separated) hardware address.
    std::map<std::string, boost::asio::ip::address_v4> reserved;

    boost::asio::ip::address_v4 subnet_mask() const { return network.netmask(); }
    uint64_t range_size() const
    {
        return range_hi.to_uint() >= range_lo.to_uint()
            ? uint64_t{range_hi.to_uint()} - range_lo.to_uint() + 1 : 0;
    }
};

// Both return false after logging the reason if the configuration is
// malformed or fails validation.
[[nodiscard]] bool parse_config(const char *path, subnet_config &cfg);
[[nodiscard]] bool parse_config_string(const std::string &text, subnet_config &cfg);

// Semantic checks that apply however the configuration was built.
[[nodiscard]] bool validate_config(const subnet_config &cfg);

#endif
