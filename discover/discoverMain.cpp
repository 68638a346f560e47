// discoverMain.cpp - Command line front end: finds Speedwire devices on the local network and prints them.
#include "DiscoverOptions.hpp"
#include "connection/ConnectionRegistry.hpp"
#include "options/Options.hpp"
#include "logger.hpp"
#include "Deadline.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <thread>

using namespace speedwire;

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

// Signal handler for graceful shutdown
static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Parse CLI/JSON options ---
    // Options auto-register via static objects
    speedwire_opts::Options::set_app_info("speedwire-discover", "0.1");
    std::string opts_err;
    auto parse_res = speedwire_opts::Options::load_and_parse(argc, argv, opts_err);
    if (parse_res == speedwire_opts::Options::ParseResult::Help ||
        parse_res == speedwire_opts::Options::ParseResult::Version) {
        return 0; // help/version already printed
    }
    if (parse_res == speedwire_opts::Options::ParseResult::Error) {
        std::cerr << "speedwire-discover option parse error: " << opts_err << std::endl;
        return 2;
    }
    const DiscoverOptions opts = speedwire_opts::discover_opts::get();

    // --- Stage 2: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("discover");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(parse_log_level(opts.log_level));
    logger->add_sink(stdout_sink);

    try {
        // --- Stage 3: Open the multicast connection ---
        ConnectionOptions conn_opts;
        conn_opts.group_address = opts.group;
        conn_opts.port = static_cast<std::uint16_t>(opts.port);
        conn_opts.logger = logger;
        conn_opts.detailed_packet_logging = opts.verbose_packets;

        ConnectionRegistry registry(conn_opts);
        auto connection = registry.obtain(opts.interface_name);

        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);

        // --- Stage 4: Discover, printing devices as they are verified ---
        Deadline deadline(std::chrono::milliseconds(opts.timeout_ms));
        std::thread interrupt_watch([&deadline]() {
            while (!deadline.wait_for(std::chrono::milliseconds(100))) {
                if (shutdown_requested.load(std::memory_order_relaxed)) {
                    deadline.cancel();
                }
            }
        });

        auto results = std::make_shared<BoundedQueue<std::shared_ptr<Device>>>(conn_opts.results_capacity);
        std::size_t found = 0;
        std::thread printer([&found, results]() {
            while (auto device = results->pop()) {
                std::cout << (*device)->serial() << "\t" << (*device)->ip() << "\tsusy " << (*device)->susy_id()
                          << std::endl;
                ++found;
            }
        });

        logger->info("searching for devices for " + std::to_string(opts.timeout_ms) + " ms");
        try {
            connection->discover_devices(deadline, results, opts.password);
        } catch (const std::exception&) {
            deadline.cancel();
            results->close();
            interrupt_watch.join();
            printer.join();
            throw;
        }
        results->close();
        interrupt_watch.join();
        printer.join();

        logger->info("found " + std::to_string(found) + " device(s)");
        registry.release(opts.interface_name);

    } catch (const std::exception& e) {
        logger->error(std::string("discover failed: ") + e.what());
        return 1;
    }

    return 0;
}
