#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "../shared/SignalMessage.h"

namespace PeerBeam {

    // Client side of the framed signaling link. Frames are read on a private
    // io thread; handlers run on that thread and must not block.
    class SignalingClient {
    public:
        using MessageHandler = std::function<void(const SignalMessage&)>;
        using CloseHandler = std::function<void(const std::string& reason)>;

        SignalingClient();
        ~SignalingClient();

        SignalingClient(const SignalingClient&) = delete;
        SignalingClient& operator=(const SignalingClient&) = delete;

        // Handlers must be installed before Connect().
        void SetMessageHandler(MessageHandler handler);
        void SetCloseHandler(CloseHandler handler);

        // Blocks until connected. Throws TransportError on failure or timeout.
        void Connect(const std::string& host, uint16_t port,
            std::chrono::milliseconds timeout = std::chrono::seconds(10));
        void Disconnect();
        bool IsConnected() const;

        // Throws TransportError when the link is down.
        void Send(const SignalMessage& msg);

    private:
        struct Impl;
        std::unique_ptr<Impl> m_Impl;

        void ReadHeader();
        void ReadBody();
        void CloseSocket(const std::string& reason);
    };

} // namespace PeerBeam
