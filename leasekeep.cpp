// Copyright 2014-2024 Nicholas J. Kain <njkain at gmail dot com>
// SPDX-License-Identifier: MIT
#define LEASEKEEP_VERSION "1.0"

#include <unistd.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <getopt.h>
#include <signal.h>
#include <errno.h>
#include <algorithm>
#include <chrono>
#include <functional>
#include <istream>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <fmt/format.h>
#include "cfg.hpp"
#include "dhcp4.hpp"
#include "dynlease.hpp"
#include "log.hpp"

namespace ba = boost::asio;

static const char *configfile = "/etc/leasekeep.conf";
static const char *interface_override;
static bool test_config_only;
static bool use_syslog;
static unsigned sweep_interval = 60;
static unsigned worker_count;

// Periodically reclaims expired leases so that idle addresses do not
// wait for the next allocation to return to the pool.
class SweepTimer
{
public:
    SweepTimer(ba::io_context &io, DynLease4 &leases, unsigned interval)
        : timer_(io), leases_(leases), interval_(interval) {}
    SweepTimer(const SweepTimer &) = delete;
    SweepTimer &operator=(const SweepTimer &) = delete;

    void start() { if (interval_) set_timer(); }
    void stop() { timer_.cancel(); }
private:
    void set_timer()
    {
        timer_.expires_after(std::chrono::seconds(interval_));
        timer_.async_wait([this](const boost::system::error_code &ec) {
            if (ec) return;
            leases_.sweep();
            const auto st = leases_.stats();
            log_line("dynlease: %zu free, %zu active, %zu reserved\n",
                     st.free, st.active, st.reserved);
            set_timer();
        });
    }

    ba::steady_timer timer_;
    DynLease4 &leases_;
    unsigned interval_;
};

// Reads decoded client events, one per line as "<kind> <hwaddr>", and
// handles each on the worker pool.
class EventListener
{
public:
    EventListener(ba::io_context &io, ba::thread_pool &workers, D4Handler &handler)
        : input_(io), workers_(workers), handler_(handler) {}
    EventListener(const EventListener &) = delete;
    EventListener &operator=(const EventListener &) = delete;

    // Fails if stdin cannot be polled, e.g. when it is a regular file.
    [[nodiscard]] bool init()
    {
        const auto fd = ::dup(STDIN_FILENO);
        if (fd < 0) {
            log_error("failed to dup stdin: %s\n", strerror(errno));
            return false;
        }
        boost::system::error_code ec;
        input_.assign(fd, ec);
        if (ec) {
            log_error("can't read events from stdin: %s\n", ec.message());
            ::close(fd);
            return false;
        }
        return true;
    }

    void start(std::function<void()> on_close)
    {
        on_close_ = std::move(on_close);
        start_receive();
    }
    void stop()
    {
        boost::system::error_code ec;
        input_.close(ec);
    }
private:
    void start_receive()
    {
        ba::async_read_until(input_, buf_, '\n',
            [this](const boost::system::error_code &ec, size_t) {
                if (ec) {
                    if (ec == ba::error::eof && buf_.size()) {
                        // Final line had no terminating newline.
                        std::istream is(&buf_);
                        std::string line;
                        std::getline(is, line);
                        dispatch(line);
                    } else if (ec != ba::error::eof && ec != ba::error::operation_aborted) {
                        log_error("event input failed: %s\n", ec.message());
                    }
                    if (on_close_) on_close_();
                    return;
                }
                std::istream is(&buf_);
                std::string line;
                std::getline(is, line);
                dispatch(line);
                start_receive();
            });
    }
    void dispatch(const std::string &line)
    {
        static const char ws[] = " \t\r";
        const auto st = line.find_first_not_of(ws);
        if (st == std::string::npos || line[st] == '#') return;
        const auto sp = line.find_first_of(ws, st);
        const auto hst = sp == std::string::npos ? sp : line.find_first_not_of(ws, sp);
        if (hst == std::string::npos) {
            log_line("Ignoring malformed event '%s'\n", line);
            return;
        }
        const auto kw = line.substr(st, sp - st);
        const auto hw = line.substr(hst, line.find_first_of(ws, hst) - hst);
        RequestKind kind;
        if (kw == "discover") kind = RequestKind::Discover;
        else if (kw == "request") kind = RequestKind::Request;
        else if (kw == "release") kind = RequestKind::Release;
        else {
            log_line("Ignoring unknown event '%s'\n", kw);
            return;
        }
        ba::post(workers_, [this, kind, hw]() {
            const auto reply = handler_.process(hw, kind);
            if (!reply) return;
            const auto s = d4_reply_str(*reply);
            std::lock_guard<std::mutex> lk(out_mtx_);
            fmt::print("{}\n", s);
            fflush(stdout);
        });
    }

    ba::posix::stream_descriptor input_;
    ba::streambuf buf_;
    ba::thread_pool &workers_;
    D4Handler &handler_;
    std::function<void()> on_close_;
    std::mutex out_mtx_;
};

static void usage()
{
    printf("leasekeep " LEASEKEEP_VERSION ", DHCPv4 lease allocation server.\n");
    printf("Copyright 2014-2024 Nicholas J. Kain\n");
    printf("leasekeep [options]...\n\nOptions:\n");
    printf("--config          -c []  Path to configuration file.\n");
    printf("--interface       -i []  Interface to serve; overrides the configuration.\n");
    printf("--test            -t     Check the configuration and exit.\n");
    printf("--sweep           -s []  Seconds between expired lease sweeps (0 disables).\n");
    printf("--workers         -w []  Number of request handling threads.\n");
    printf("--syslog          -S     Log to syslog instead of stderr.\n");
    printf("--version         -v     Print version and exit.\n");
    printf("--help            -h     Print this help and exit.\n");
}

static void print_version()
{
    log_line("leasekeep " LEASEKEEP_VERSION ", dhcpv4 lease allocation server.\n"
             "Copyright 2014-2024 Nicholas J. Kain\n"
             "Distributed under the MIT license.\n");
}

static unsigned parse_uint_option(const char *name, const char *arg)
{
    char *endptr = nullptr;
    errno = 0;
    const auto v = strtoul(arg, &endptr, 10);
    if (errno || endptr == arg || *endptr || v > 86400u)
        suicide("invalid value '%s' for --%s\n", arg, name);
    return static_cast<unsigned>(v);
}

static void process_options(int ac, char *av[])
{
    static struct option long_options[] = {
        {"config", 1, nullptr, 'c'},
        {"interface", 1, nullptr, 'i'},
        {"test", 0, nullptr, 't'},
        {"sweep", 1, nullptr, 's'},
        {"workers", 1, nullptr, 'w'},
        {"syslog", 0, nullptr, 'S'},
        {"version", 0, nullptr, 'v'},
        {"help", 0, nullptr, 'h'},
        {nullptr, 0, nullptr, 0 }
    };
    for (;;) {
        auto c = getopt_long(ac, av, "c:i:ts:w:Svh", long_options, nullptr);
        if (c == -1) break;
        switch (c) {
            case 'c': configfile = optarg; break;
            case 'i': interface_override = optarg; break;
            case 't': test_config_only = true; break;
            case 's': sweep_interval = parse_uint_option("sweep", optarg); break;
            case 'w': worker_count = parse_uint_option("workers", optarg); break;
            case 'S': use_syslog = true; break;
            case 'v': print_version(); exit(EXIT_SUCCESS); break;
            case 'h': usage(); exit(EXIT_SUCCESS); break;
            default: usage(); exit(EXIT_FAILURE); break;
        }
    }
}

int main(int ac, char *av[])
{
    process_options(ac, av);
    if (use_syslog) log_set_daemon();

    subnet_config cfg;
    if (!parse_config(configfile, cfg))
        suicide("Failed to load configuration file '%s'.\n", configfile);
    // Precedence: command line, then configuration file, then default.
    if (interface_override)
        cfg.interface = interface_override;
    else if (cfg.interface.empty())
        cfg.interface = LEASEKEEP_DEFAULT_INTERFACE;

    if (test_config_only) {
        log_line("Configuration '%s' is valid.\n", configfile);
        exit(EXIT_SUCCESS);
    }

    if (!worker_count) worker_count = std::max(1u, std::thread::hardware_concurrency());

    signal(SIGPIPE, SIG_IGN);

    DynLease4 leases(cfg);
    D4Handler handler(cfg, leases);

    ba::io_context io;
    ba::thread_pool workers(worker_count);
    ba::signal_set signals(io, SIGINT, SIGTERM);
    SweepTimer sweeper(io, leases, sweep_interval);
    EventListener listener(io, workers, handler);
    if (!listener.init())
        suicide("Failed to set up the event listener.\n");

    auto shutdown = [&]() {
        signals.cancel();
        sweeper.stop();
        listener.stop();
    };
    signals.async_wait([&](const boost::system::error_code &ec, int signo) {
        if (ec) return;
        log_line("Got signal %d; exiting.\n", signo);
        shutdown();
    });
    sweeper.start();
    listener.start(shutdown);

    log_line("Serving %s (%s-%s) on interface %s with %zu free addresses.\n",
             cfg.network.to_string(), cfg.range_lo.to_string(), cfg.range_hi.to_string(),
             cfg.interface, leases.stats().free);

    io.run();
    workers.join();

    exit(EXIT_SUCCESS);
}
