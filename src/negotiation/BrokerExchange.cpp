#include "BrokerExchange.h"
#include "../core/Logger.h"

namespace PeerBeam {

    BrokerExchange::BrokerExchange(std::string host, uint16_t port,
        std::chrono::milliseconds connectTimeout)
        : m_Host(std::move(host)), m_Port(port), m_ConnectTimeout(connectTimeout) {
    }

    BrokerExchange::~BrokerExchange() {
        Close();
    }

    void BrokerExchange::Start(EventQueue& events) {
        m_Client.SetMessageHandler([this, &events](const SignalMessage& msg) { OnSignal(events, msg); });
        m_Client.SetCloseHandler([&events](const std::string& reason) {
            events.Push(EventKind::SignalingClosed, reason);
        });
        m_Client.Connect(m_Host, m_Port, m_ConnectTimeout);
    }

    void BrokerExchange::OnSignal(EventQueue& events, const SignalMessage& msg) {
        switch (msg.type) {
        case SignalType::RoomCreated:
        case SignalType::RoomJoined:
            events.Push(EventKind::RoomReady, msg.roomId);
            break;
        case SignalType::PeerJoined:
            events.Push(EventKind::PeerJoined, msg.roomId);
            break;
        case SignalType::PeerLeft:
            events.Push(EventKind::PeerLeft, msg.roomId);
            break;
        case SignalType::Offer:
        case SignalType::Answer: {
            NegotiationEvent ev;
            ev.kind = EventKind::RemoteDescription;
            ev.text = msg.sdp;
            ev.fileId = msg.fileId;
            events.Push(std::move(ev));
            break;
        }
        case SignalType::Error:
            events.Push(EventKind::SignalingError, msg.error);
            break;
        default:
            LOG_WARN("unexpected signal '" + msg.rawType + "' from broker");
            break;
        }
    }

    void BrokerExchange::CreateRoom(const std::string& roomId) {
        m_Client.Send(SignalMessage::Make(SignalType::CreateRoom, roomId));
    }

    void BrokerExchange::JoinRoom(const std::string& roomId) {
        m_Client.Send(SignalMessage::Make(SignalType::JoinRoom, roomId));
    }

    void BrokerExchange::PublishOffer(const std::string& roomId, const std::string& fileId,
        const std::string& blob) {
        SignalMessage msg = SignalMessage::Make(SignalType::Offer, roomId);
        msg.fileId = fileId;
        msg.sdp = blob;
        m_Client.Send(msg);
    }

    void BrokerExchange::PublishAnswer(const std::string& roomId, const std::string& blob) {
        SignalMessage msg = SignalMessage::Make(SignalType::Answer, roomId);
        msg.sdp = blob;
        m_Client.Send(msg);
    }

    void BrokerExchange::Close() {
        m_Client.Disconnect();
    }

} // namespace PeerBeam
