// Copyright 2011-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#include <fmt/format.h>
#include "dhcp4.hpp"
#include "macstr.hpp"
#include "log.hpp"

namespace ba = boost::asio;

static const char *msgtype_str(uint8_t type)
{
    switch (type) {
    case DHCPOFFER: return "offer";
    case DHCPACK: return "ack";
    default: return "unknown";
    }
}

std::string d4_reply_str(const d4_reply &r)
{
    auto s = fmt::format("{} {} {} mask {} lease {}", msgtype_str(r.type), r.hwaddr,
                         r.yiaddr.to_string(), r.subnet_mask.to_string(), r.lease_time);
    if (r.router) s += fmt::format(" router {}", r.router->to_string());
    if (!r.dns_servers.empty()) {
        s += " dns";
        for (const auto &i: r.dns_servers) s += fmt::format(" {}", i.to_string());
    }
    return s;
}

std::optional<d4_reply> D4Handler::create_reply(const std::string &hwaddr, uint8_t type)
{
    ba::ip::address_v4 addr;
    const auto r = leases_.resolve(hwaddr, addr);
    if (r != ResolveStatus::Ok) {
        log_line("dhcp4: Error getting IP for %s: %s\n", hwaddr, resolve_status_str(r));
        return {};
    }
    d4_reply reply;
    reply.type = type;
    reply.hwaddr = hwaddr;
    reply.yiaddr = addr;
    reply.subnet_mask = cfg_.subnet_mask();
    reply.lease_time = cfg_.lease_duration;
    reply.router = cfg_.gateway;
    reply.dns_servers = cfg_.dns_servers;
    return reply;
}

std::optional<d4_reply> D4Handler::reply_discover(const std::string &hwaddr)
{
    log_line("dhcp4: Got DHCP4 discover message from %s\n", hwaddr);
    auto reply = create_reply(hwaddr, DHCPOFFER);
    if (reply) log_line("dhcp4: Offering IP %s to %s\n", reply->yiaddr.to_string(), hwaddr);
    return reply;
}

std::optional<d4_reply> D4Handler::reply_request(const std::string &hwaddr)
{
    log_line("dhcp4: Got DHCP4 request message from %s\n", hwaddr);
    auto reply = create_reply(hwaddr, DHCPACK);
    if (reply) log_line("dhcp4: Assigned IP %s to %s\n", reply->yiaddr.to_string(), hwaddr);
    return reply;
}

void D4Handler::do_release(const std::string &hwaddr)
{
    if (leases_.release(hwaddr))
        log_line("dhcp4: Released lease for %s\n", hwaddr);
    else
        log_line("dhcp4: Ignoring release from %s; no dynamic lease\n", hwaddr);
}

std::optional<d4_reply> D4Handler::process(const std::string &hwaddr, RequestKind kind)
{
    std::string canon;
    if (!macstr_canonical(hwaddr, canon)) {
        log_line("dhcp4: Ignoring message with bad hardware address '%s'\n", hwaddr);
        return {};
    }
    switch (kind) {
    case RequestKind::Discover: return reply_discover(canon);
    case RequestKind::Request: return reply_request(canon);
    case RequestKind::Release: do_release(canon); return {};
    }
    return {};
}

std::optional<d4_reply> D4Handler::process(const uint8_t *hwaddr, RequestKind kind)
{
    return process(macraw_to_str(hwaddr), kind);
}
