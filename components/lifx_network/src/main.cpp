#include "lifx_network/config.hpp"
#include "lifx_network/connection_pool.hpp"
#include "lifx_network/discovery.hpp"
#include "lifx_protocol/error.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

namespace po = boost::program_options;

// Global signal handler
std::atomic<bool> g_running(true);
constexpr std::chrono::milliseconds kInterruptPoll{250};

void signalHandler(int) {
    g_running = false;
}

namespace {

void echoDevice(lifx_network::ConnectionPool& pool, const lifx_network::DiscoveredDevice& device) {
    const std::vector<uint8_t> probe = {'l', 'i', 'f', 'x'};
    try {
        auto connection = pool.getConnection(device);
        auto start = std::chrono::steady_clock::now();
        auto reply = connection->request(lifx_protocol::packets::echoRequest(probe));
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        const auto& response = std::get<lifx_network::Response>(reply);
        bool intact = response.payload.size() >= probe.size() &&
                      std::equal(probe.begin(), probe.end(), response.payload.begin());
        std::cout << "  echo " << device.serial.toString() << ": " << elapsed.count() << "ms"
                  << (intact ? "" : " (payload mismatch)") << std::endl;
    } catch (const lifx_protocol::LifxError& e) {
        std::cout << "  echo " << device.serial.toString() << ": failed - " << e.what() << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        po::options_description desc("LIFX discovery options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("timeout,t", po::value<double>(), "Overall scan timeout in seconds")
            ("broadcast,b", po::value<std::string>(), "Broadcast address")
            ("port,p", po::value<uint16_t>(), "Device UDP port")
            ("echo,e", po::bool_switch()->default_value(false), "Echo each discovered device through a pooled connection")
            ("verbose,v", po::bool_switch()->default_value(false), "Enable debug logging");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        spdlog::set_level(vm["verbose"].as<bool>() ? spdlog::level::debug : spdlog::level::warn);

        lifx_network::DiscoveryOptions options;
        lifx_network::ConnectionPool::Config poolConfig;
        if (vm.count("config")) {
            const auto& path = vm["config"].as<std::string>();
            options = lifx_network::Config::loadDiscoveryOptions(path);
            poolConfig = lifx_network::Config::loadPoolConfig(path);
        }
        if (vm.count("timeout")) {
            options.timeout = std::chrono::milliseconds(
                static_cast<long long>(vm["timeout"].as<double>() * 1000.0));
        }
        if (vm.count("broadcast")) {
            options.broadcastAddress = vm["broadcast"].as<std::string>();
        }
        if (vm.count("port")) {
            options.port = vm["port"].as<uint16_t>();
        }

        std::cout << "Discovering devices on " << options.broadcastAddress << ":" << options.port
                  << " for up to " << options.timeout.count() << "ms" << std::endl;

        lifx_network::ConnectionPool pool(poolConfig);
        auto stream = lifx_network::discover(options);
        size_t found = 0;

        // Poll in short slices so SIGINT ends the scan promptly
        while (g_running && !stream.finished()) {
            auto device = stream.next(kInterruptPoll);
            if (!device) {
                continue;
            }
            ++found;
            std::cout << device->serial.toString() << "  " << device->ip << ":" << device->port
                      << "  " << device->responseTime.count() << "ms" << std::endl;

            if (vm["echo"].as<bool>()) {
                echoDevice(pool, *device);
            }
        }
        stream.close();

        std::cout << found << " device(s) found" << std::endl;

        if (vm["echo"].as<bool>()) {
            auto metrics = pool.getMetrics();
            std::cout << "Pool: " << metrics.totalRequests << " requests, "
                      << metrics.evictions << " evictions" << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
