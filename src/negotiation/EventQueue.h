#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

namespace PeerBeam {

    enum class EventKind {
        // from the description exchange
        RoomReady,
        PeerJoined,
        PeerLeft,
        RemoteDescription,
        SignalingError,
        SignalingClosed,
        // from the transport engine
        GatheringComplete,
        ChannelOpen,
        ChannelMessage,
        ChannelClosed
    };

    const char* EventKindName(EventKind kind);

    // Connectivity is a level, not an edge: waits observe the latest state
    // without having to consume intermediate transitions.
    enum class LinkState { New, Connecting, Connected, Disconnected, Failed, Closed };

    const char* LinkStateName(LinkState state);
    inline bool IsLinkLost(LinkState s) {
        return s == LinkState::Disconnected || s == LinkState::Failed || s == LinkState::Closed;
    }

    struct NegotiationEvent {
        EventKind            kind = EventKind::SignalingError;
        std::string          text;    // remote description blob or error text
        std::string          fileId;  // set on offers
        std::vector<uint8_t> payload; // channel message bytes
    };

    enum class WaitStatus { Ready, TimedOut, LinkLost };

    // Single funnel for everything the negotiator and the transfer loop react
    // to. Producers are transport and signaling callbacks on foreign threads.
    class EventQueue {
    public:
        using Clock = std::chrono::steady_clock;

        void Push(NegotiationEvent ev);
        void Push(EventKind kind, std::string text = {});

        void SetLinkState(LinkState state);
        LinkState GetLinkState() const;

        // Removes and returns the oldest queued event whose kind is listed.
        // Events of other kinds stay queued. Matching events win over a lost
        // link so data that arrived before a close is never dropped.
        WaitStatus WaitFor(std::initializer_list<EventKind> kinds, Clock::time_point deadline,
            NegotiationEvent& out);

        // Ready once the link has reached Connected, even if it dropped again
        // before the caller looked; what arrived meanwhile is still queued.
        WaitStatus WaitForConnected(Clock::time_point deadline);

        size_t Pending() const;

    private:
        bool TakeLocked(std::initializer_list<EventKind> kinds, NegotiationEvent& out);

        mutable std::mutex           m_Mutex;
        std::condition_variable      m_Cv;
        std::deque<NegotiationEvent> m_Events;
        LinkState                    m_Link = LinkState::New;
        bool                         m_WasConnected = false;
    };

} // namespace PeerBeam
