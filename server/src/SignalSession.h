#pragma once
#include "RoomMember.h"
#include "shared/Protocol.h"
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace PeerBeam {

    class SignalingServer;

    // One persistent signaling connection. Reads, writes and timers all run on
    // m_Strand; Deliver() and Close() may be called from any thread.
    class SignalSession : public RoomMember, public std::enable_shared_from_this<SignalSession> {
    public:
        SignalSession(asio::ip::tcp::socket socket, SignalingServer& server);

        void Start();

        void Deliver(const SignalMessage& msg) override;
        void Close() override;
        std::string Describe() const override { return m_Remote; }

        bool IsClosed() const { return m_Closed.load(std::memory_order_relaxed); }

    private:
        void ReadHeader();
        void ReadBody();
        void ProcessFrame();
        void Enqueue(std::shared_ptr<std::vector<uint8_t>> buffer);
        void DoWrite();
        void ArmReadDeadline();
        void SchedulePing();
        void Disconnect(const std::string& reason);

        asio::ip::tcp::socket                            m_Socket;
        SignalingServer&                                 m_Server;
        asio::strand<asio::any_io_executor>              m_Strand;
        asio::steady_timer                               m_PingTimer;
        asio::steady_timer                               m_ReadDeadline;
        asio::steady_timer                               m_WriteDeadline;
        FrameHeader                                      m_Header{};
        std::vector<uint8_t>                             m_Body;
        std::deque<std::shared_ptr<std::vector<uint8_t>>> m_WriteQueue;
        std::atomic<bool>                                m_Closed{ false };
        std::string                                      m_Remote;
    };

} // namespace PeerBeam
