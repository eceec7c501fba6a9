#include "SignalingServer.h"
#include "core/Logger.h"
#include "Version.h"
#include <asio.hpp>
#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <csignal>

namespace {

    // Re-register after each delivery so a second Ctrl+C during drain is still
    // handled here instead of by the OS default.
    void ArmSignals(asio::signal_set& signals, asio::io_context& io_context,
        PeerBeam::SignalingServer& server) {
        signals.async_wait([&signals, &io_context, &server](const std::error_code& ec, int signo) {
            if (ec) return;
            LOG_INFO("shutdown requested by signal " + std::to_string(signo));
            server.Stop();
            io_context.stop();
            ArmSignals(signals, io_context, server);
        });
    }

    void PrintUsage() {
        std::cout << "Usage: peerbeam-signaling [--port N] [--bind ADDR] [--config FILE] [--log FILE]\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    try {
        PeerBeam::BrokerConfig config;
        std::string configPath, portArg, bindArg, logArg;

        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&](std::string& out) {
                if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
                out = argv[++i];
            };
            if (arg == "--port") next(portArg);
            else if (arg == "--bind") next(bindArg);
            else if (arg == "--config") next(configPath);
            else if (arg == "--log") next(logArg);
            else if (arg == "--help" || arg == "-h") { PrintUsage(); return 0; }
            else if (arg == "--version") { std::cout << PEERBEAM_VERSION_STRING << "\n"; return 0; }
            else throw std::runtime_error("unknown argument: " + arg);
        }

        if (!configPath.empty()) config = PeerBeam::BrokerConfig::LoadFromFile(configPath);
        if (!portArg.empty()) {
            const int port = std::stoi(portArg);
            if (port <= 0 || port > 65535) throw std::runtime_error("invalid port: " + portArg);
            config.port = static_cast<uint16_t>(port);
        }
        if (!bindArg.empty()) config.bindAddress = bindArg;
        if (!logArg.empty()) config.logFile = logArg;
        if (!config.logFile.empty() && !PeerBeam::Logger::Instance().Initialize(config.logFile))
            std::cerr << "cannot open log file " << config.logFile << "\n";

        asio::io_context io_context;
        PeerBeam::SignalingServer server(io_context, config);

        asio::signal_set signals(io_context, SIGINT, SIGTERM);
        ArmSignals(signals, io_context, server);

        // The broker only relays small JSON frames; a handful of threads is plenty.
        constexpr unsigned int kMaxThreads = 16u;
        unsigned int thread_count = std::thread::hardware_concurrency();
        if (thread_count == 0) thread_count = 4;
        thread_count = std::min(thread_count, kMaxThreads);

        LOG_INFO(std::string("PeerBeam signaling ") + PEERBEAM_VERSION_STRING + " listening on "
            + config.bindAddress + ":" + std::to_string(server.Port())
            + " with " + std::to_string(thread_count) + " threads");

        std::vector<std::thread> threads;
        threads.reserve(thread_count);
        for (unsigned int i = 0; i < thread_count; ++i)
            threads.emplace_back([&io_context] { io_context.run(); });
        for (auto& t : threads) t.join();
    }
    catch (const std::exception& e) {
        std::cerr << "peerbeam-signaling: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
