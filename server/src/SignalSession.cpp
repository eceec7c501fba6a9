#include "SignalSession.h"
#include "SignalingServer.h"
#include "core/Logger.h"

using asio::ip::tcp;

namespace {
    constexpr auto kWriteTimeout = std::chrono::seconds(10);
}

namespace PeerBeam {

    SignalSession::SignalSession(tcp::socket socket, SignalingServer& server)
        : m_Socket(std::move(socket))
        , m_Server(server)
        , m_Strand(asio::make_strand(m_Socket.get_executor()))
        , m_PingTimer(m_Strand)
        , m_ReadDeadline(m_Strand)
        , m_WriteDeadline(m_Strand) {
        std::error_code ec;
        auto ep = m_Socket.remote_endpoint(ec);
        m_Remote = ec ? std::string("unknown") : ep.address().to_string() + ':' + std::to_string(ep.port());
    }

    void SignalSession::Start() {
        asio::post(m_Strand, [this, self = shared_from_this()]() {
            m_Server.JoinClient(self);
            ArmReadDeadline();
            SchedulePing();
            ReadHeader();
        });
    }

    void SignalSession::Close() {
        asio::post(m_Strand, [this, self = shared_from_this()]() {
            Disconnect("closed by server");
        });
    }

    void SignalSession::Disconnect(const std::string& reason) {
        if (m_Closed.exchange(true)) return;
        LOG_SIGNAL(m_Remote + " disconnected: " + reason);

        m_PingTimer.cancel();
        m_ReadDeadline.cancel();
        m_WriteDeadline.cancel();
        m_WriteQueue.clear();

        auto self = shared_from_this();
        m_Server.Dispatcher().Leave(self);
        m_Server.LeaveClient(self);

        std::error_code ec;
        m_Socket.shutdown(tcp::socket::shutdown_both, ec);
        m_Socket.close(ec);
    }

    void SignalSession::ArmReadDeadline() {
        m_ReadDeadline.expires_after(m_Server.Config().readDeadline);
        m_ReadDeadline.async_wait([this, self = shared_from_this()](const std::error_code& ec) {
            if (ec) return; // re-armed or cancelled
            Disconnect("read deadline expired");
        });
    }

    void SignalSession::SchedulePing() {
        m_PingTimer.expires_after(m_Server.Config().pingInterval);
        m_PingTimer.async_wait([this, self = shared_from_this()](const std::error_code& ec) {
            if (ec || m_Closed.load()) return;
            Enqueue(std::make_shared<std::vector<uint8_t>>(EncodeFrame(FrameType::Ping, {})));
            SchedulePing();
        });
    }

    void SignalSession::ReadHeader() {
        asio::async_read(m_Socket, asio::buffer(&m_Header, sizeof(FrameHeader)),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (ec) {
                    Disconnect(ec == asio::error::eof ? "peer closed" : ec.message());
                    return;
                }
                m_Header.ToHost();
                if (m_Header.size > m_Server.Config().maxFrameBytes) {
                    Disconnect("frame of " + std::to_string(m_Header.size) + " bytes exceeds limit");
                    return;
                }
                m_Body.resize(m_Header.size);
                ReadBody();
            }));
    }

    void SignalSession::ReadBody() {
        asio::async_read(m_Socket, asio::buffer(m_Body),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (ec) { Disconnect(ec.message()); return; }
                ArmReadDeadline();
                ProcessFrame();
                if (!m_Closed.load()) ReadHeader();
            }));
    }

    void SignalSession::ProcessFrame() {
        switch (m_Header.type) {
        case FrameType::Signal:
            m_Server.Dispatcher().Dispatch(shared_from_this(),
                std::string(m_Body.begin(), m_Body.end()));
            break;
        case FrameType::Ping:
            Enqueue(std::make_shared<std::vector<uint8_t>>(EncodeFrame(FrameType::Pong, {})));
            break;
        case FrameType::Pong:
            break;
        default:
            Deliver(SignalMessage::MakeError(SignalErrorText(SignalErrorCode::MalformedMessage)));
            break;
        }
    }

    void SignalSession::Deliver(const SignalMessage& msg) {
        Enqueue(std::make_shared<std::vector<uint8_t>>(EncodeFrame(FrameType::Signal, msg.Serialize())));
    }

    void SignalSession::Enqueue(std::shared_ptr<std::vector<uint8_t>> buffer) {
        asio::post(m_Strand, [this, self = shared_from_this(), buffer]() {
            if (m_Closed.load()) return;
            if (m_WriteQueue.size() >= m_Server.Config().outboundQueueLimit) {
                LOG_WARN(m_Remote + ": outbound queue full");
                Disconnect("outbound queue overflow");
                return;
            }
            // front() is owned by the in-flight async_write; only append here.
            bool writeInProgress = !m_WriteQueue.empty();
            m_WriteQueue.push_back(buffer);
            if (!writeInProgress) DoWrite();
        });
    }

    void SignalSession::DoWrite() {
        if (m_WriteQueue.empty()) return;

        m_WriteDeadline.expires_after(kWriteTimeout);
        m_WriteDeadline.async_wait([this, self = shared_from_this()](const std::error_code& ec) {
            if (ec) return;
            Disconnect("write deadline expired");
        });

        // The handler holds the buffer so Disconnect() may clear the queue
        // while the write is still in flight.
        auto buffer = m_WriteQueue.front();
        asio::async_write(m_Socket, asio::buffer(*buffer),
            asio::bind_executor(m_Strand, [this, self = shared_from_this(), buffer](std::error_code ec, std::size_t) {
                m_WriteDeadline.cancel();
                if (m_Closed.load()) return;
                if (ec) { Disconnect("write failed: " + ec.message()); return; }
                m_WriteQueue.pop_front();
                if (!m_WriteQueue.empty()) DoWrite();
            }));
    }

} // namespace PeerBeam
