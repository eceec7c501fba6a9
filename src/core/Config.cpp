#include "Config.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

    json ReadJsonFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
            throw std::runtime_error("cannot open config file: " + path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        try {
            json j = json::parse(buffer.str());
            if (!j.is_object())
                throw std::runtime_error("config file " + path + " must contain a JSON object");
            return j;
        }
        catch (const json::parse_error& e) {
            throw std::runtime_error("config file " + path + ": " + e.what());
        }
    }

    template <typename T>
    void Read(const json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        try {
            target = it->get<T>();
        }
        catch (const json::exception& e) {
            throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
        }
    }

    void ReadMillis(const json& j, const char* key, PeerBeam::Millis& target) {
        int64_t ms = target.count();
        Read(j, key, ms);
        if (ms <= 0)
            throw std::runtime_error(std::string("config key '") + key + "' must be positive");
        target = PeerBeam::Millis(ms);
    }

    void ReadPort(const json& j, const char* key, uint16_t& target) {
        int64_t port = target;
        Read(j, key, port);
        if (port < 0 || port > 65535)
            throw std::runtime_error(std::string("config key '") + key + "' is not a valid port");
        target = static_cast<uint16_t>(port);
    }

    bool StartsWith(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

} // namespace

namespace PeerBeam {

    BrokerConfig BrokerConfig::LoadFromFile(const std::string& path) {
        BrokerConfig cfg;
        const json j = ReadJsonFile(path);
        Read(j, "bind_address", cfg.bindAddress);
        ReadPort(j, "port", cfg.port);
        Read(j, "outbound_queue_limit", cfg.outboundQueueLimit);
        ReadMillis(j, "ping_interval_ms", cfg.pingInterval);
        ReadMillis(j, "read_deadline_ms", cfg.readDeadline);
        Read(j, "max_frame_bytes", cfg.maxFrameBytes);
        Read(j, "log_file", cfg.logFile);

        if (cfg.outboundQueueLimit == 0)
            throw std::runtime_error("config key 'outbound_queue_limit' must be positive");
        if (cfg.pingInterval >= cfg.readDeadline)
            throw std::runtime_error("config key 'ping_interval_ms' must be shorter than 'read_deadline_ms'");
        return cfg;
    }

    std::vector<std::string> PeerConfig::DefaultIceServers() {
        return {
            "stun:175.24.2.28:3478",
            "turn:demo:demo123@175.24.2.28:3478?transport=udp",
            "turn:demo:demo123@175.24.2.28:3478?transport=tcp",
        };
    }

    PeerConfig PeerConfig::LoadFromFile(const std::string& path) {
        PeerConfig cfg;
        const json j = ReadJsonFile(path);
        Read(j, "ice_servers", cfg.iceServers);
        Read(j, "signaling_host", cfg.signalingHost);
        ReadPort(j, "signaling_port", cfg.signalingPort);
        Read(j, "room_id", cfg.roomId);
        Read(j, "manual_exchange", cfg.manualExchange);
        Read(j, "chunk_size", cfg.chunkSize);
        Read(j, "log_file", cfg.logFile);
        Read(j, "debug", cfg.debug);

        if (auto it = j.find("timeouts"); it != j.end() && it->is_object()) {
            const json& t = *it;
            ReadMillis(t, "room_confirm_ms", cfg.timeouts.roomConfirm);
            ReadMillis(t, "peer_join_ms", cfg.timeouts.peerJoin);
            ReadMillis(t, "remote_description_ms", cfg.timeouts.remoteDescription);
            ReadMillis(t, "gathering_ms", cfg.timeouts.gathering);
            ReadMillis(t, "connectivity_ms", cfg.timeouts.connectivity);
            ReadMillis(t, "channel_open_ms", cfg.timeouts.channelOpen);
            ReadMillis(t, "acknowledgement_ms", cfg.timeouts.acknowledgement);
            ReadMillis(t, "transfer_ms", cfg.timeouts.transfer);
        }
        cfg.Validate();
        return cfg;
    }

    void PeerConfig::OverrideStun(const std::string& server) {
        if (server.empty()) return;
        std::string url = StartsWith(server, "stun:") ? server : "stun:" + server;
        iceServers.erase(std::remove_if(iceServers.begin(), iceServers.end(),
            [](const std::string& s) { return StartsWith(s, "stun:"); }), iceServers.end());
        iceServers.insert(iceServers.begin(), url);
    }

    void PeerConfig::OverrideTurn(const std::string& server) {
        if (server.empty()) return;
        std::string url = StartsWith(server, "turn:") ? server : "turn:" + server;
        iceServers.erase(std::remove_if(iceServers.begin(), iceServers.end(),
            [](const std::string& s) { return StartsWith(s, "turn:"); }), iceServers.end());
        iceServers.push_back(url);
    }

    void PeerConfig::SetSignalingEndpoint(const std::string& endpoint) {
        std::string rest = endpoint;
        if (auto scheme = rest.find("://"); scheme != std::string::npos)
            rest = rest.substr(scheme + 3);
        if (auto slash = rest.find('/'); slash != std::string::npos)
            rest = rest.substr(0, slash);
        if (rest.empty())
            throw std::runtime_error("signaling endpoint is empty");

        auto colon = rest.rfind(':');
        if (colon == std::string::npos) {
            signalingHost = rest;
            return;
        }
        int port = 0;
        try {
            port = std::stoi(rest.substr(colon + 1));
        }
        catch (const std::exception&) {
            throw std::runtime_error("invalid signaling port in '" + endpoint + "'");
        }
        if (port <= 0 || port > 65535)
            throw std::runtime_error("invalid signaling port in '" + endpoint + "'");
        signalingHost = rest.substr(0, colon);
        signalingPort = static_cast<uint16_t>(port);
    }

    void PeerConfig::Validate() const {
        if (chunkSize == 0 || chunkSize > kMaxChunkSize)
            throw std::runtime_error("config key 'chunk_size' must be between 1 and "
                + std::to_string(kMaxChunkSize));
        if (!manualExchange && signalingHost.empty())
            throw std::runtime_error("config key 'signaling_host' must not be empty");
    }

} // namespace PeerBeam
