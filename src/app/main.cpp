#include "PeerClient.h"
#include "ReceiveAddress.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include "../shared/Encoding.h"
#include "Version.h"
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

    void PrintUsage() {
        std::cout <<
            "Usage:\n"
            "  peerbeam send <file> [options]\n"
            "  peerbeam receive <file-id | id|offer | http-address> [save-path] [options]\n"
            "\n"
            "Options:\n"
            "  --signaling HOST:PORT   signaling broker (default 175.24.2.28:37851)\n"
            "  --room ID               room id (default: the file id)\n"
            "  --stun HOST:PORT        STUN server\n"
            "  --turn HOST:PORT        TURN server\n"
            "  --manual                exchange descriptions by copy and paste\n"
            "  --chunk-size BYTES      payload chunk size (default 32768)\n"
            "  --config FILE           JSON configuration file\n"
            "  --log FILE              append log lines to FILE\n"
            "  --debug                 log session descriptions\n";
    }

    struct CommandLine {
        std::string              command;
        std::vector<std::string> positional;
        std::string              configPath, signaling, room, stun, turn, chunkSize, logFile;
        bool                     manual = false;
        bool                     debug = false;
    };

    CommandLine ParseCommandLine(int argc, char* argv[]) {
        CommandLine cl;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto next = [&](std::string& out) {
                if (i + 1 >= argc) throw std::runtime_error("missing value for " + arg);
                out = argv[++i];
            };
            if (arg == "--signaling") next(cl.signaling);
            else if (arg == "--room") next(cl.room);
            else if (arg == "--stun") next(cl.stun);
            else if (arg == "--turn") next(cl.turn);
            else if (arg == "--chunk-size") next(cl.chunkSize);
            else if (arg == "--config") next(cl.configPath);
            else if (arg == "--log") next(cl.logFile);
            else if (arg == "--manual") cl.manual = true;
            else if (arg == "--debug") cl.debug = true;
            else if (arg.rfind("--", 0) == 0 && arg != "--help" && arg != "--version")
                throw std::runtime_error("unknown option: " + arg);
            else if (cl.command.empty()) cl.command = arg;
            else cl.positional.push_back(arg);
        }
        return cl;
    }

    PeerBeam::PeerConfig BuildConfig(const CommandLine& cl) {
        PeerBeam::PeerConfig config;
        if (!cl.configPath.empty()) config = PeerBeam::PeerConfig::LoadFromFile(cl.configPath);
        if (!cl.signaling.empty()) config.SetSignalingEndpoint(cl.signaling);
        if (!cl.room.empty()) config.roomId = cl.room;
        config.OverrideStun(cl.stun);
        config.OverrideTurn(cl.turn);
        if (!cl.chunkSize.empty()) config.chunkSize = static_cast<size_t>(std::stoul(cl.chunkSize));
        if (!cl.logFile.empty()) config.logFile = cl.logFile;
        if (cl.manual) config.manualExchange = true;
        if (cl.debug) config.debug = true;
        config.Validate();
        return config;
    }

    // Redraws one status line at most five times a second.
    PeerBeam::ProgressCallback MakeProgressPrinter() {
        auto lastPrint = std::make_shared<std::chrono::steady_clock::time_point>();
        auto mutex = std::make_shared<std::mutex>();
        return [lastPrint, mutex](const PeerBeam::TransferProgress& p) {
            std::lock_guard<std::mutex> lock(*mutex);
            const auto now = std::chrono::steady_clock::now();
            const bool done = p.total > 0 && p.bytes >= p.total;
            if (!done && now - *lastPrint < std::chrono::milliseconds(200)) return;
            *lastPrint = now;
            if (p.total > 0)
                std::printf("\rProgress: %.1f%% (%.2f MB/s)   ", p.percent, p.mbps);
            else
                std::printf("\rReceived: %.2f MB (%.2f MB/s)   ", p.bytes / (1024.0 * 1024.0), p.mbps);
            if (done) std::printf("\n");
            std::fflush(stdout);
        };
    }

    void PrintReport(const char* verb, const PeerBeam::TransferReport& report) {
        std::printf("%s %s: %lld bytes in %.2fs (%.2f MB/s)\n", verb, report.fileName.c_str(),
            static_cast<long long>(report.bytes), report.seconds, report.mbps);
        if (!report.path.empty() && std::string(verb) == "Received")
            std::printf("Saved to %s\n", report.path.string().c_str());
    }

    int RunSend(const CommandLine& cl, const PeerBeam::PeerConfig& config) {
        if (cl.positional.empty()) throw std::runtime_error("send: missing file path");

        auto exchanges = config.manualExchange
            ? PeerBeam::PeerClient::ManualExchanges(std::cin, std::cout)
            : PeerBeam::PeerClient::BrokerExchanges(config);
        PeerBeam::PeerClient client(config, PeerBeam::PeerClient::RtcTransports(config), exchanges);
        client.SetProgressCallback(MakeProgressPrinter());

        const std::string fileId = PeerBeam::GenerateFileId();
        if (!config.manualExchange)
            std::printf("File ID: %s\nOn the other machine run: peerbeam receive %s\n", fileId.c_str(), fileId.c_str());

        const PeerBeam::TransferReport report = client.SendFile(cl.positional[0], fileId);
        PrintReport("Sent", report);
        if (!report.acknowledged && report.bytes > 0)
            std::printf("Warning: the receiver did not confirm delivery\n");
        return 0;
    }

    int RunReceive(const CommandLine& cl, const PeerBeam::PeerConfig& config) {
        if (cl.positional.empty()) throw std::runtime_error("receive: missing file id or address");
        const std::string savePath = cl.positional.size() > 1 ? cl.positional[1] : std::string();

        const PeerBeam::ReceiveAddress addr = PeerBeam::ClassifyReceiveAddress(cl.positional[0]);
        if (addr.kind == PeerBeam::AddressKind::Http)
            throw std::runtime_error("HTTP download (" + addr.url + ") is served by the HTTP fallback, "
                "which this build does not include");

        PeerBeam::PeerConfig effective = config;
        if (!addr.manualOffer.empty()) effective.manualExchange = true;

        auto exchanges = effective.manualExchange
            ? PeerBeam::PeerClient::ManualExchanges(std::cin, std::cout, addr.manualOffer, addr.fileId)
            : PeerBeam::PeerClient::BrokerExchanges(effective);
        PeerBeam::PeerClient client(effective, PeerBeam::PeerClient::RtcTransports(effective), exchanges);
        client.SetProgressCallback(MakeProgressPrinter());

        const PeerBeam::TransferReport report = client.ReceiveFile(addr.fileId, savePath);
        PrintReport("Received", report);
        return 0;
    }

} // namespace

int main(int argc, char* argv[]) {
    try {
        const CommandLine cl = ParseCommandLine(argc, argv);
        if (cl.command.empty() || cl.command == "--help" || cl.command == "help") {
            PrintUsage();
            return cl.command.empty() ? 1 : 0;
        }
        if (cl.command == "--version") {
            std::cout << "peerbeam " << PEERBEAM_VERSION_STRING << "\n";
            return 0;
        }

        const PeerBeam::PeerConfig config = BuildConfig(cl);
        if (!config.logFile.empty() && !PeerBeam::Logger::Instance().Initialize(config.logFile))
            std::cerr << "cannot open log file " << config.logFile << "\n";
        PeerBeam::Logger::Instance().SetVerbose(config.debug);

        if (cl.command == "send") return RunSend(cl, config);
        if (cl.command == "receive") return RunReceive(cl, config);
        PrintUsage();
        return 1;
    }
    catch (const PeerBeam::NegotiationError& e) {
        std::cerr << "peerbeam: " << (e.TimedOut() ? "timed out " : "") << e.what() << "\n";
    }
    catch (const PeerBeam::TransferError& e) {
        std::cerr << "peerbeam: transfer failed: " << e.what() << "\n";
    }
    catch (const PeerBeam::TransportError& e) {
        std::cerr << "peerbeam: signaling failed: " << e.what() << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "peerbeam: " << e.what() << "\n";
    }
    return 1;
}
