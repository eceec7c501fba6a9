#include "SessionNegotiator.h"
#include "../core/Errors.h"
#include "../core/Logger.h"

namespace PeerBeam {

    const char* NegotiationPhaseName(NegotiationPhase phase) {
        switch (phase) {
        case NegotiationPhase::Idle:                      return "Idle";
        case NegotiationPhase::Joined:                    return "Joined";
        case NegotiationPhase::RemoteDescriptionReceived: return "RemoteDescriptionReceived";
        case NegotiationPhase::LocalDescriptionCreated:   return "LocalDescriptionCreated";
        case NegotiationPhase::LocalDescriptionSent:      return "LocalDescriptionSent";
        case NegotiationPhase::RemoteDescriptionApplied:  return "RemoteDescriptionApplied";
        case NegotiationPhase::ConnectivityEstablished:   return "ConnectivityEstablished";
        case NegotiationPhase::ChannelOpen:               return "ChannelOpen";
        case NegotiationPhase::Completed:                 return "Completed";
        case NegotiationPhase::Failed:                    return "Failed";
        case NegotiationPhase::TimedOut:                  return "TimedOut";
        }
        return "?";
    }

    SessionNegotiator::SessionNegotiator(NegotiationRole role, PeerTransport& transport,
        DescriptionExchange& exchange, EventQueue& events, NegotiationTimeouts timeouts)
        : m_Role(role), m_Transport(transport), m_Exchange(exchange)
        , m_Events(events), m_Timeouts(timeouts) {
    }

    std::shared_ptr<DataChannel> SessionNegotiator::Run(const std::string& roomId, const std::string& fileId) {
        m_Started = std::chrono::steady_clock::now();
        m_FileId = fileId;
        m_Exchange.Start(m_Events);
        return m_Role == NegotiationRole::Sender ? RunSender(roomId) : RunReceiver(roomId);
    }

    std::shared_ptr<DataChannel> SessionNegotiator::RunSender(const std::string& roomId) {
        m_Transport.CreateDataChannel(kFileChannelLabel);
        const std::string offer = CreateLocalBlob();
        Advance(NegotiationPhase::LocalDescriptionCreated);

        if (m_Exchange.UsesRoom()) {
            EnterRoom(true, roomId);
            LOG_NEGOTIATE("waiting for a receiver to join room " + roomId);
            Await({ EventKind::PeerJoined, EventKind::SignalingError, EventKind::SignalingClosed },
                m_Timeouts.peerJoin, "waiting for peer");
            LOG_NEGOTIATE("receiver joined room " + roomId);
        }

        m_Exchange.PublishOffer(roomId, m_FileId, offer);
        Advance(NegotiationPhase::LocalDescriptionSent);

        NegotiationEvent answer = AwaitRemoteDescription();
        ApplyRemote(answer.text, "answer");
        Advance(NegotiationPhase::RemoteDescriptionApplied);

        AwaitConnectivity();
        Advance(NegotiationPhase::ConnectivityEstablished);

        return AwaitChannel();
    }

    std::shared_ptr<DataChannel> SessionNegotiator::RunReceiver(const std::string& roomId) {
        if (m_Exchange.UsesRoom()) {
            EnterRoom(false, roomId);
            Advance(NegotiationPhase::Joined);
        }

        NegotiationEvent offer = AwaitRemoteDescription();
        if (!offer.fileId.empty()) m_FileId = offer.fileId;
        Advance(NegotiationPhase::RemoteDescriptionReceived);

        ApplyRemote(offer.text, "offer");
        const std::string answer = CreateLocalBlob();
        Advance(NegotiationPhase::LocalDescriptionCreated);

        m_Exchange.PublishAnswer(roomId, answer);
        Advance(NegotiationPhase::LocalDescriptionSent);

        AwaitConnectivity();
        Advance(NegotiationPhase::ConnectivityEstablished);

        return AwaitChannel();
    }

    void SessionNegotiator::EnterRoom(bool create, const std::string& roomId) {
        if (create) m_Exchange.CreateRoom(roomId);
        else m_Exchange.JoinRoom(roomId);
        Await({ EventKind::RoomReady, EventKind::SignalingError, EventKind::SignalingClosed },
            m_Timeouts.roomConfirm, create ? "creating room" : "joining room");
        LOG_NEGOTIATE(std::string(create ? "created" : "joined") + " room " + roomId);
    }

    std::string SessionNegotiator::CreateLocalBlob() {
        m_Transport.CreateLocalDescription();

        NegotiationEvent ev;
        const auto deadline = std::chrono::steady_clock::now() + m_Timeouts.gathering;
        switch (m_Events.WaitFor({ EventKind::GatheringComplete }, deadline, ev)) {
        case WaitStatus::Ready:
            break;
        case WaitStatus::TimedOut:
            LOG_WARN("candidate gathering did not finish in time, using the candidates found so far");
            break;
        case WaitStatus::LinkLost:
            Fail("gathering candidates", false,
                std::string("connection ") + LinkStateName(m_Events.GetLinkState()));
        }

        SessionDescription desc = m_Transport.LocalDescription();
        if (desc.sdp.empty())
            Fail("creating local description", false, "transport produced no description");
        LOG_DEBUG("local " + desc.type + ":\n" + desc.sdp);
        return EncodeSessionDescription(desc);
    }

    NegotiationEvent SessionNegotiator::AwaitRemoteDescription() {
        const bool sender = m_Role == NegotiationRole::Sender;
        m_Exchange.RequestRemoteDescription();
        return Await({ EventKind::RemoteDescription, EventKind::PeerLeft,
                       EventKind::SignalingError, EventKind::SignalingClosed },
            m_Timeouts.remoteDescription, sender ? "waiting for answer" : "waiting for offer");
    }

    void SessionNegotiator::ApplyRemote(const std::string& blob, const char* expectedType) {
        const std::string what = std::string("applying remote ") + expectedType;
        try {
            SessionDescription desc = DecodeSessionDescription(blob);
            if (desc.type != expectedType)
                Fail(what, false, "received " + desc.type + " instead");
            LOG_DEBUG("remote " + desc.type + ":\n" + desc.sdp);
            m_Transport.ApplyRemoteDescription(desc);
        }
        catch (const ProtocolError& e) {
            Fail(what, false, e.what());
        }
    }

    void SessionNegotiator::AwaitConnectivity() {
        const auto deadline = std::chrono::steady_clock::now() + m_Timeouts.connectivity;
        switch (m_Events.WaitForConnected(deadline)) {
        case WaitStatus::Ready:
            break;
        case WaitStatus::TimedOut:
            Fail("establishing connectivity", true,
                "timed out after " + std::to_string(m_Timeouts.connectivity.count()) + "ms");
        case WaitStatus::LinkLost:
            Fail("establishing connectivity", false,
                std::string("connection ") + LinkStateName(m_Events.GetLinkState()));
        }
    }

    std::shared_ptr<DataChannel> SessionNegotiator::AwaitChannel() {
        NegotiationEvent ev = Await({ EventKind::ChannelOpen, EventKind::ChannelClosed },
            m_Timeouts.channelOpen, "opening data channel");
        if (ev.kind == EventKind::ChannelClosed)
            Fail("opening data channel", false, "channel closed before opening");

        auto channel = m_Transport.Channel();
        if (!channel) Fail("opening data channel", false, "transport has no channel");
        Advance(NegotiationPhase::ChannelOpen);
        return channel;
    }

    NegotiationEvent SessionNegotiator::Await(std::initializer_list<EventKind> kinds,
        std::chrono::milliseconds timeout, const std::string& what) {
        NegotiationEvent ev;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        switch (m_Events.WaitFor(kinds, deadline, ev)) {
        case WaitStatus::TimedOut:
            Fail(what, true, "timed out after " + std::to_string(timeout.count()) + "ms");
        case WaitStatus::LinkLost:
            Fail(what, false, std::string("connection ") + LinkStateName(m_Events.GetLinkState()));
        case WaitStatus::Ready:
            break;
        }

        switch (ev.kind) {
        case EventKind::SignalingError:  Fail(what, false, "signaling error: " + ev.text);
        case EventKind::SignalingClosed: Fail(what, false, "signaling link closed: " + ev.text);
        case EventKind::PeerLeft:        Fail(what, false, "peer left the room");
        default:                         break;
        }
        return ev;
    }

    void SessionNegotiator::Fail(const std::string& what, bool timedOut, const std::string& reason) {
        m_Phase = timedOut ? NegotiationPhase::TimedOut : NegotiationPhase::Failed;
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - m_Started);
        LOG_NEGOTIATE(what + ": " + reason);
        throw NegotiationError(what, elapsed, timedOut, reason);
    }

    void SessionNegotiator::Advance(NegotiationPhase next) {
        m_Phase = next;
        LOG_NEGOTIATE(std::string("phase -> ") + NegotiationPhaseName(next));
    }

} // namespace PeerBeam
