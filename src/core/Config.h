#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace PeerBeam {

    using Millis = std::chrono::milliseconds;

    struct NegotiationTimeouts {
        Millis roomConfirm{ 5'000 };
        Millis peerJoin{ 5 * 60'000 };
        Millis remoteDescription{ 5 * 60'000 };
        Millis gathering{ 10'000 };
        Millis connectivity{ 60'000 };
        Millis channelOpen{ 30'000 };
        Millis acknowledgement{ 5 * 60'000 };
        Millis transfer{ 30 * 60'000 };
    };

    struct BrokerConfig {
        std::string bindAddress = "0.0.0.0";
        uint16_t    port = 37851;
        size_t      outboundQueueLimit = 256;
        Millis      pingInterval{ 54'000 };
        Millis      readDeadline{ 60'000 };
        uint32_t    maxFrameBytes = 1024 * 1024;
        std::string logFile;

        // Keys absent from the file keep their defaults. Throws std::runtime_error
        // naming the offending key when a value has the wrong type or range.
        static BrokerConfig LoadFromFile(const std::string& path);
    };

    struct PeerConfig {
        // ICE server URLs in libdatachannel form:
        //   stun:host:port
        //   turn:user:password@host:port?transport=udp
        std::vector<std::string> iceServers = DefaultIceServers();
        std::string signalingHost = "175.24.2.28";
        uint16_t    signalingPort = 37851;
        std::string roomId;
        bool        manualExchange = false;
        size_t      chunkSize = 32 * 1024;
        NegotiationTimeouts timeouts;
        std::string logFile;
        bool        debug = false;

        static constexpr size_t kMaxChunkSize = 64 * 1024;

        static std::vector<std::string> DefaultIceServers();
        static PeerConfig LoadFromFile(const std::string& path);

        // A user supplied server replaces the matching defaults. A missing
        // "stun:" / "turn:" scheme is added.
        void OverrideStun(const std::string& server);
        void OverrideTurn(const std::string& server);
        // "host:port", "tcp://host:port" or a bare host.
        void SetSignalingEndpoint(const std::string& endpoint);
        void Validate() const;
    };

} // namespace PeerBeam
