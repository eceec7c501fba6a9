#include "SignalingClient.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include "../shared/Protocol.h"
#include <asio.hpp>
#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace PeerBeam {

    struct SignalingClient::Impl {
        asio::io_context          m_Context;
        asio::ip::tcp::socket     m_Socket{ m_Context };
        std::thread               m_ContextThread;
        std::atomic<bool>         m_IsConnected{ false };
        std::atomic<bool>         m_CloseReported{ false };
        FrameHeader               m_InHeader{};
        std::vector<uint8_t>      m_InBody;
        std::deque<std::shared_ptr<std::vector<uint8_t>>> m_WriteQueue;
        MessageHandler            m_OnMessage;
        CloseHandler              m_OnClose;

        void DoWrite(SignalingClient* parent) {
            if (m_WriteQueue.empty()) return;
            auto buffer = m_WriteQueue.front();
            asio::async_write(m_Socket, asio::buffer(*buffer),
                [this, parent, buffer](std::error_code ec, std::size_t) {
                    if (ec) {
                        parent->CloseSocket("write failed: " + ec.message());
                        return;
                    }
                    m_WriteQueue.pop_front();
                    DoWrite(parent);
                });
        }

        void Post(SignalingClient* parent, std::shared_ptr<std::vector<uint8_t>> buffer) {
            asio::post(m_Context, [this, parent, buffer] {
                if (!m_IsConnected.load()) return;
                bool writeInProgress = !m_WriteQueue.empty();
                m_WriteQueue.push_back(buffer);
                if (!writeInProgress) DoWrite(parent);
            });
        }
    };

    SignalingClient::SignalingClient() : m_Impl(std::make_unique<Impl>()) {}

    SignalingClient::~SignalingClient() {
        Disconnect();
    }

    void SignalingClient::SetMessageHandler(MessageHandler handler) {
        m_Impl->m_OnMessage = std::move(handler);
    }

    void SignalingClient::SetCloseHandler(CloseHandler handler) {
        m_Impl->m_OnClose = std::move(handler);
    }

    void SignalingClient::Connect(const std::string& host, uint16_t port,
        std::chrono::milliseconds timeout) {
        if (IsConnected()) return;
        const std::string target = host + ":" + std::to_string(port);

        asio::ip::tcp::resolver::results_type endpoints;
        try {
            asio::ip::tcp::resolver resolver(m_Impl->m_Context);
            endpoints = resolver.resolve(host, std::to_string(port));
        }
        catch (const std::system_error& e) {
            throw TransportError("cannot resolve signaling server " + target + ": " + e.what());
        }

        std::error_code result = asio::error::would_block;
        asio::async_connect(m_Impl->m_Socket, endpoints,
            [&result](std::error_code ec, const asio::ip::tcp::endpoint&) { result = ec; });
        m_Impl->m_Context.restart();
        m_Impl->m_Context.run_for(timeout);

        if (result == asio::error::would_block) {
            std::error_code ec;
            m_Impl->m_Socket.close(ec);
            throw TransportError("timed out connecting to signaling server " + target);
        }
        if (result)
            throw TransportError("cannot connect to signaling server " + target + ": " + result.message());

        std::error_code ec;
        m_Impl->m_Socket.set_option(asio::ip::tcp::no_delay(true), ec);
        m_Impl->m_IsConnected.store(true);
        m_Impl->m_CloseReported.store(false);
        m_Impl->m_Context.restart();
        ReadHeader();

        m_Impl->m_ContextThread = std::thread([this] {
            auto guard = asio::make_work_guard(m_Impl->m_Context);
            try {
                m_Impl->m_Context.run();
            }
            catch (const std::exception& e) {
                LOG_ERROR(std::string("signaling io thread: ") + e.what());
            }
            m_Impl->m_IsConnected.store(false);
        });
        LOG_SIGNAL("connected to " + target);
    }

    // Safe to call from asio handlers (runs on the io thread; never joins itself).
    void SignalingClient::CloseSocket(const std::string& reason) {
        m_Impl->m_IsConnected.store(false);
        std::error_code ec;
        if (m_Impl->m_Socket.is_open()) {
            m_Impl->m_Socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            m_Impl->m_Socket.close(ec);
        }
        if (!m_Impl->m_CloseReported.exchange(true)) {
            LOG_SIGNAL("signaling link closed: " + reason);
            if (m_Impl->m_OnClose) m_Impl->m_OnClose(reason);
        }
    }

    void SignalingClient::Disconnect() {
        if (!m_Impl) return;
        // Suppress the close callback for a locally requested shutdown.
        m_Impl->m_CloseReported.store(true);
        m_Impl->m_Context.stop();
        if (m_Impl->m_ContextThread.joinable())
            m_Impl->m_ContextThread.join();

        // The io thread is gone; the socket and queue are ours again.
        m_Impl->m_IsConnected.store(false);
        m_Impl->m_WriteQueue.clear();
        std::error_code ec;
        if (m_Impl->m_Socket.is_open()) {
            m_Impl->m_Socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            m_Impl->m_Socket.close(ec);
        }
    }

    bool SignalingClient::IsConnected() const {
        return m_Impl && m_Impl->m_IsConnected.load();
    }

    void SignalingClient::Send(const SignalMessage& msg) {
        if (!IsConnected()) throw TransportError("signaling link is not connected");
        m_Impl->Post(this, std::make_shared<std::vector<uint8_t>>(
            EncodeFrame(FrameType::Signal, msg.Serialize())));
    }

    void SignalingClient::ReadHeader() {
        asio::async_read(m_Impl->m_Socket,
            asio::buffer(&m_Impl->m_InHeader, sizeof(FrameHeader)),
            [this](std::error_code ec, std::size_t) {
                if (ec) { CloseSocket(ec == asio::error::eof ? "server closed the connection" : ec.message()); return; }
                m_Impl->m_InHeader.ToHost();
                if (m_Impl->m_InHeader.size > kMaxFrameSize) {
                    CloseSocket("oversized frame");
                    return;
                }
                m_Impl->m_InBody.resize(m_Impl->m_InHeader.size);
                ReadBody();
            });
    }

    void SignalingClient::ReadBody() {
        asio::async_read(m_Impl->m_Socket,
            asio::buffer(m_Impl->m_InBody),
            [this](std::error_code ec, std::size_t) {
                if (ec) { CloseSocket(ec.message()); return; }

                switch (m_Impl->m_InHeader.type) {
                case FrameType::Ping:
                    m_Impl->Post(this, std::make_shared<std::vector<uint8_t>>(EncodeFrame(FrameType::Pong, {})));
                    break;
                case FrameType::Pong:
                    break;
                case FrameType::Signal: {
                    try {
                        SignalMessage msg = SignalMessage::Parse(
                            std::string(m_Impl->m_InBody.begin(), m_Impl->m_InBody.end()));
                        LOG_DEBUG("signal <- " + msg.Serialize());
                        if (m_Impl->m_OnMessage) m_Impl->m_OnMessage(msg);
                    }
                    catch (const ProtocolError& e) {
                        LOG_WARN(std::string("ignoring malformed signal: ") + e.what());
                    }
                    break;
                }
                default:
                    LOG_WARN("ignoring unknown frame type");
                    break;
                }
                ReadHeader();
            });
    }

} // namespace PeerBeam
