#pragma once
#include "DescriptionExchange.h"
#include "../network/SignalingClient.h"
#include <chrono>
#include <cstdint>
#include <string>

namespace PeerBeam {

    // Descriptions travel through the signaling broker.
    class BrokerExchange : public DescriptionExchange {
    public:
        BrokerExchange(std::string host, uint16_t port,
            std::chrono::milliseconds connectTimeout = std::chrono::seconds(10));
        ~BrokerExchange() override;

        void Start(EventQueue& events) override;
        bool UsesRoom() const override { return true; }
        void CreateRoom(const std::string& roomId) override;
        void JoinRoom(const std::string& roomId) override;
        void PublishOffer(const std::string& roomId, const std::string& fileId,
            const std::string& blob) override;
        void PublishAnswer(const std::string& roomId, const std::string& blob) override;
        void RequestRemoteDescription() override {}
        void Close() override;

    private:
        void OnSignal(EventQueue& events, const SignalMessage& msg);

        std::string               m_Host;
        uint16_t                  m_Port;
        std::chrono::milliseconds m_ConnectTimeout;
        SignalingClient           m_Client;
    };

} // namespace PeerBeam
