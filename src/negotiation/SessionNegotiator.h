#pragma once
#include "DescriptionExchange.h"
#include "EventQueue.h"
#include "../core/Config.h"
#include "../transport/PeerTransport.h"
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>

namespace PeerBeam {

    enum class NegotiationRole { Sender, Receiver };

    enum class NegotiationPhase {
        Idle,
        Joined,
        RemoteDescriptionReceived,
        LocalDescriptionCreated,
        LocalDescriptionSent,
        RemoteDescriptionApplied,
        ConnectivityEstablished,
        ChannelOpen,
        Completed,
        Failed,
        TimedOut
    };

    const char* NegotiationPhaseName(NegotiationPhase phase);

    // Drives one peer from nothing to an open data channel.
    //
    // Sender:   Idle -> LocalDescriptionCreated -> LocalDescriptionSent
    //           -> RemoteDescriptionApplied -> ConnectivityEstablished -> ChannelOpen
    // Receiver: Idle -> Joined -> RemoteDescriptionReceived -> LocalDescriptionCreated
    //           -> LocalDescriptionSent -> ConnectivityEstablished -> ChannelOpen
    //
    // Joined is skipped when the exchange has no rooms. Every wait is bounded;
    // a lost link ends any wait at once. Failures throw NegotiationError and
    // leave the phase at Failed or TimedOut.
    class SessionNegotiator {
    public:
        SessionNegotiator(NegotiationRole role, PeerTransport& transport,
            DescriptionExchange& exchange, EventQueue& events, NegotiationTimeouts timeouts);

        // `fileId` is announced by the sender and learned by the receiver.
        std::shared_ptr<DataChannel> Run(const std::string& roomId, const std::string& fileId = {});

        // Terminal bookkeeping for the caller once the transfer itself ends.
        void MarkCompleted() { m_Phase = NegotiationPhase::Completed; }
        void MarkFailed() { m_Phase = NegotiationPhase::Failed; }

        NegotiationPhase Phase() const { return m_Phase.load(); }
        const std::string& FileId() const { return m_FileId; }

    private:
        std::shared_ptr<DataChannel> RunSender(const std::string& roomId);
        std::shared_ptr<DataChannel> RunReceiver(const std::string& roomId);

        void EnterRoom(bool create, const std::string& roomId);
        std::string CreateLocalBlob();
        void ApplyRemote(const std::string& blob, const char* expectedType);
        NegotiationEvent AwaitRemoteDescription();
        void AwaitConnectivity();
        std::shared_ptr<DataChannel> AwaitChannel();

        NegotiationEvent Await(std::initializer_list<EventKind> kinds,
            std::chrono::milliseconds timeout, const std::string& what);
        [[noreturn]] void Fail(const std::string& what, bool timedOut, const std::string& reason);
        void Advance(NegotiationPhase next);

        NegotiationRole     m_Role;
        PeerTransport&      m_Transport;
        DescriptionExchange& m_Exchange;
        EventQueue&         m_Events;
        NegotiationTimeouts m_Timeouts;

        std::atomic<NegotiationPhase>         m_Phase{ NegotiationPhase::Idle };
        std::string                           m_FileId;
        std::chrono::steady_clock::time_point m_Started;
    };

} // namespace PeerBeam
