// Copyright 2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
// Test cases for the dynamic lease allocator

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>
#include <catch2/catch.hpp>
#include "dynlease.hpp"
#include "log.hpp"

using boost::asio::ip::address_v4;
using boost::asio::ip::make_address_v4;

static const std::string MAC_A = "de:ad:be:ef:00:0a";
static const std::string MAC_B = "de:ad:be:ef:00:0b";
static const std::string MAC_C = "de:ad:be:ef:00:0c";
static const std::string MAC_D = "de:ad:be:ef:00:0d";
static const std::string MAC_R = "aa:bb:cc:dd:ee:ff";

static subnet_config make_config(const char *lo, const char *hi, uint32_t lease_duration)
{
    subnet_config cfg;
    cfg.network = boost::asio::ip::make_network_v4("10.0.0.0/16");
    cfg.range_lo = make_address_v4(lo);
    cfg.range_hi = make_address_v4(hi);
    cfg.lease_duration = lease_duration;
    return cfg;
}

static std::string client_mac(unsigned i)
{
    return fmt::format("02:00:00:00:{:02x}:{:02x}", (i >> 8) & 0xff, i & 0xff);
}

// Shortcut that fails the test unless resolve() succeeds.
static address_v4 resolve_ok(DynLease4 &leases, const std::string &hwaddr)
{
    address_v4 a;
    REQUIRE(leases.resolve(hwaddr, a) == ResolveStatus::Ok);
    return a;
}

TEST_CASE("DynLease4") {
    log_set_quiet(true);
    int64_t now = 1000;
    auto clock = [&now]() { return now; };

    // Three addresses, one second leases.
    SECTION("exhaust-then-reclaim") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.4", 1), clock);
        CHECK(resolve_ok(leases, MAC_A) == make_address_v4("10.0.0.2"));
        CHECK(resolve_ok(leases, MAC_B) == make_address_v4("10.0.0.3"));
        CHECK(resolve_ok(leases, MAC_C) == make_address_v4("10.0.0.4"));

        address_v4 a;
        CHECK(leases.resolve(MAC_D, a) == ResolveStatus::PoolExhausted);
        CHECK_FALSE(leases.lookup(MAC_D));

        now += 2;
        CHECK(resolve_ok(leases, MAC_D) == make_address_v4("10.0.0.2"));
        // The other two expired leases were reclaimed by the same sweep.
        CHECK(leases.stats().free == 2);
        CHECK_FALSE(leases.lookup(MAC_A));
    }

    SECTION("exhaustion") {
        constexpr unsigned N = 16;
        DynLease4 leases(make_config("10.0.1.0", "10.0.1.15", 3600), clock);
        std::set<address_v4> seen;
        for (unsigned i = 0; i < N; ++i)
            seen.insert(resolve_ok(leases, client_mac(i)));
        CHECK(seen.size() == N);
        address_v4 a;
        CHECK(leases.resolve(client_mac(N), a) == ResolveStatus::PoolExhausted);
        // Failure does not disturb existing clients.
        CHECK(resolve_ok(leases, client_mac(3)) == make_address_v4("10.0.1.3"));
    }

    SECTION("stickiness") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.10", 60), clock);
        const auto a = resolve_ok(leases, MAC_A);
        resolve_ok(leases, MAC_B);
        now += 30;
        CHECK(resolve_ok(leases, MAC_A) == a);
        const auto l = leases.lookup(MAC_A);
        REQUIRE(l);
        CHECK(l->expire_time == now + 60);
    }

    SECTION("expired-but-unswept-lease-is-reused") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.10", 60), clock);
        const auto a = resolve_ok(leases, MAC_A);
        now += 600;
        CHECK(resolve_ok(leases, MAC_A) == a);
    }

    SECTION("reservation-precedence") {
        auto cfg = make_config("10.0.0.2", "10.0.0.4", 60);
        cfg.reserved[MAC_R] = make_address_v4("10.0.0.3");
        DynLease4 leases(cfg, clock);
        CHECK(leases.stats().free == 2);
        CHECK(resolve_ok(leases, MAC_A) == make_address_v4("10.0.0.2"));
        CHECK(resolve_ok(leases, MAC_B) == make_address_v4("10.0.0.4"));
        for (int i = 0; i < 3; ++i) {
            CHECK(resolve_ok(leases, MAC_R) == make_address_v4("10.0.0.3"));
            now += 100;
        }
        // Reserved records survive sweeps even after expiring.
        CHECK(leases.sweep() == 2);
        REQUIRE(leases.lookup(MAC_R));
        CHECK(leases.lookup(MAC_R)->addr == make_address_v4("10.0.0.3"));
        CHECK_FALSE(leases.release(MAC_R));
        CHECK(leases.stats().free == 2);
    }

    SECTION("reservation-outside-range-when-exhausted") {
        auto cfg = make_config("10.0.0.2", "10.0.0.3", 60);
        cfg.reserved[MAC_R] = make_address_v4("10.0.0.50");
        DynLease4 leases(cfg, clock);
        resolve_ok(leases, MAC_A);
        resolve_ok(leases, MAC_B);
        address_v4 a;
        CHECK(leases.resolve(MAC_C, a) == ResolveStatus::PoolExhausted);
        CHECK(resolve_ok(leases, MAC_R) == make_address_v4("10.0.0.50"));
        CHECK(resolve_ok(leases, MAC_R) == make_address_v4("10.0.0.50"));
    }

    SECTION("reserved-address-invalid") {
        auto cfg = make_config("10.0.0.2", "10.0.0.3", 60);
        cfg.reserved[MAC_R] = address_v4();
        DynLease4 leases(cfg, clock);
        address_v4 a;
        CHECK(leases.resolve(MAC_R, a) == ResolveStatus::ReservedAddressInvalid);
        CHECK(resolve_ok(leases, MAC_A) == make_address_v4("10.0.0.2"));
    }

    SECTION("release") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.4", 60), clock);
        const auto a = resolve_ok(leases, MAC_A);
        CHECK(leases.release(MAC_A));
        CHECK_FALSE(leases.release(MAC_A));
        CHECK_FALSE(leases.lookup(MAC_A));
        // Released address goes to the tail of the pool.
        CHECK(resolve_ok(leases, MAC_B) == make_address_v4("10.0.0.3"));
        CHECK(resolve_ok(leases, MAC_C) == make_address_v4("10.0.0.4"));
        CHECK(resolve_ok(leases, MAC_D) == a);
    }

    SECTION("sweep") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.9", 10), clock);
        resolve_ok(leases, MAC_A);
        now += 5;
        resolve_ok(leases, MAC_B);
        CHECK(leases.sweep() == 0);
        now += 6;
        CHECK(leases.sweep() == 1);
        CHECK_FALSE(leases.lookup(MAC_A));
        CHECK(leases.lookup(MAC_B));
        // Lease ends exactly at expire_time.
        now += 4;
        CHECK(leases.stats().active == 0);
        CHECK(leases.sweep() == 1);
        CHECK(leases.stats().free == 8);
        CHECK(leases.stats().records == 0);
    }

    SECTION("reclaim-order-follows-expiry") {
        DynLease4 leases(make_config("10.0.0.2", "10.0.0.4", 10), clock);
        resolve_ok(leases, MAC_A); // .2
        resolve_ok(leases, MAC_B); // .3
        resolve_ok(leases, MAC_C); // .4
        now += 5;
        resolve_ok(leases, MAC_A); // renewed, expires last
        now += 20;
        CHECK(resolve_ok(leases, MAC_D) == make_address_v4("10.0.0.3"));
        CHECK(leases.sweep() == 0);
        CHECK(leases.stats().free == 2);
    }

    SECTION("pool-conservation") {
        auto cfg = make_config("10.0.2.0", "10.0.2.31", 10);
        cfg.reserved[MAC_R] = make_address_v4("10.0.2.7");
        DynLease4 leases(cfg, clock);
        const size_t total = cfg.range_size();
        address_v4 a;
        for (unsigned round = 0; round < 6; ++round) {
            for (unsigned i = 0; i < 40; ++i) {
                const auto mac = client_mac(round * 7 + i);
                (void)leases.resolve(mac, a);
                if (i % 5 == 0) leases.release(mac);
                const auto st = leases.stats();
                CHECK(st.free + st.active + cfg.reserved.size() <= total);
            }
            now += 4;
        }
    }

    SECTION("concurrent-no-double-binding") {
        constexpr unsigned THREADS = 8;
        constexpr unsigned PER_THREAD = 40;
        // Fewer addresses than clients so that exhaustion races too.
        DynLease4 leases(make_config("10.0.3.0", "10.0.3.199", 3600), clock);
        std::vector<std::vector<address_v4>> got(THREADS);
        std::atomic<unsigned> exhausted{0};
        std::vector<std::thread> threads;
        for (unsigned t = 0; t < THREADS; ++t) {
            threads.emplace_back([&, t]() {
                for (unsigned i = 0; i < PER_THREAD; ++i) {
                    const auto mac = client_mac(t * PER_THREAD + i);
                    address_v4 a;
                    for (int rep = 0; rep < 2; ++rep) {
                        const auto r = leases.resolve(mac, a);
                        if (r == ResolveStatus::PoolExhausted) {
                            ++exhausted;
                            break;
                        }
                        if (rep == 1) got[t].push_back(a);
                    }
                }
            });
        }
        for (auto &i: threads) i.join();

        std::set<address_v4> seen;
        size_t total = 0;
        for (const auto &v: got) {
            total += v.size();
            seen.insert(v.begin(), v.end());
        }
        CHECK(total == 200);
        CHECK(seen.size() == total);
        CHECK(exhausted.load() == THREADS * PER_THREAD - 200);
        CHECK(leases.stats().free == 0);
    }

    log_set_quiet(false);
}
