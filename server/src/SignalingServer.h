#pragma once

#include "RoomRegistry.h"
#include "SignalDispatcher.h"
#include "core/Config.h"
#include <asio.hpp>
#include <memory>
#include <set>
#include <shared_mutex>

namespace PeerBeam {

    class SignalSession;

    // ---------------------------------------------------------------------------
    // SignalingServer
    // Accepts signaling connections and owns the room registry they share.
    // ---------------------------------------------------------------------------
    class SignalingServer {
    public:
        SignalingServer(asio::io_context& io_context, BrokerConfig config);

        // Called by SignalSession on connect / disconnect.
        void JoinClient(std::shared_ptr<SignalSession> session);
        void LeaveClient(std::shared_ptr<SignalSession> session);

        // Stops accepting and closes every live session.
        void Stop();

        uint16_t Port() const;
        size_t SessionCount() const;

        const BrokerConfig& Config() const { return m_Config; }
        RoomRegistry& Rooms() { return m_Rooms; }
        SignalDispatcher& Dispatcher() { return m_Dispatcher; }

    private:
        static constexpr auto kStatsInterval = std::chrono::minutes(5);

        void DoAccept();
        void StartStatsTimer();

        // --- ASIO handles -------------------------------------------------------
        asio::io_context&       m_IoContext;
        asio::ip::tcp::acceptor m_Acceptor;
        asio::steady_timer      m_StatsTimer;
        BrokerConfig            m_Config;

        // --- Room state ---------------------------------------------------------
        RoomRegistry     m_Rooms;
        SignalDispatcher m_Dispatcher;

        // --- Session registry (guarded by m_SessionMutex) -----------------------
        mutable std::shared_mutex               m_SessionMutex;
        std::set<std::shared_ptr<SignalSession>> m_AllSessions;
    };

} // namespace PeerBeam
