#include "SignalingServer.h"
#include "SignalSession.h"   // full definition required: Stop() closes sessions
#include "core/Logger.h"
#include <mutex>
#include <vector>

using asio::ip::tcp;

namespace PeerBeam {

    SignalingServer::SignalingServer(asio::io_context& io_context, BrokerConfig config)
        : m_IoContext(io_context)
        , m_Acceptor(io_context)
        , m_StatsTimer(io_context)
        , m_Config(std::move(config))
        , m_Dispatcher(m_Rooms)
    {
        tcp::endpoint endpoint(asio::ip::make_address(m_Config.bindAddress), m_Config.port);
        m_Acceptor.open(endpoint.protocol());
        m_Acceptor.set_option(tcp::acceptor::reuse_address(true));
        m_Acceptor.bind(endpoint);
        m_Acceptor.listen();

        DoAccept();
        StartStatsTimer();
    }

    void SignalingServer::JoinClient(std::shared_ptr<SignalSession> session) {
        std::unique_lock lock(m_SessionMutex);
        m_AllSessions.insert(std::move(session));
    }

    void SignalingServer::LeaveClient(std::shared_ptr<SignalSession> session) {
        std::unique_lock lock(m_SessionMutex);
        m_AllSessions.erase(session);
    }

    void SignalingServer::Stop() {
        std::error_code ec;
        m_Acceptor.close(ec);
        m_StatsTimer.cancel();

        std::vector<std::shared_ptr<SignalSession>> sessions;
        {
            std::shared_lock lock(m_SessionMutex);
            sessions.assign(m_AllSessions.begin(), m_AllSessions.end());
        }
        for (auto& session : sessions) session->Close();
    }

    uint16_t SignalingServer::Port() const {
        std::error_code ec;
        auto ep = m_Acceptor.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    size_t SignalingServer::SessionCount() const {
        std::shared_lock lock(m_SessionMutex);
        return m_AllSessions.size();
    }

    void SignalingServer::DoAccept() {
        m_Acceptor.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted) return;
                LOG_ERROR(std::string("accept failed: ") + ec.message());
            }
            else {
                socket.set_option(tcp::no_delay(true), ec);
                auto session = std::make_shared<SignalSession>(std::move(socket), *this);
                LOG_SIGNAL("new connection from " + session->Describe());
                session->Start();
            }
            if (m_Acceptor.is_open()) DoAccept();
        });
    }

    void SignalingServer::StartStatsTimer() {
        m_StatsTimer.expires_after(kStatsInterval);
        m_StatsTimer.async_wait([this](const std::error_code& ec) {
            if (ec || !m_Acceptor.is_open()) return;
            LOG_INFO("stats: sessions=" + std::to_string(SessionCount())
                + " rooms=" + std::to_string(m_Rooms.RoomCount()));
            StartStatsTimer();
        });
    }

} // namespace PeerBeam
