#include "EventQueue.h"
#include <algorithm>

namespace PeerBeam {

    const char* EventKindName(EventKind kind) {
        switch (kind) {
        case EventKind::RoomReady:         return "room-ready";
        case EventKind::PeerJoined:        return "peer-joined";
        case EventKind::PeerLeft:          return "peer-left";
        case EventKind::RemoteDescription: return "remote-description";
        case EventKind::SignalingError:    return "signaling-error";
        case EventKind::SignalingClosed:   return "signaling-closed";
        case EventKind::GatheringComplete: return "gathering-complete";
        case EventKind::ChannelOpen:       return "channel-open";
        case EventKind::ChannelMessage:    return "channel-message";
        case EventKind::ChannelClosed:     return "channel-closed";
        }
        return "?";
    }

    const char* LinkStateName(LinkState state) {
        switch (state) {
        case LinkState::New:          return "new";
        case LinkState::Connecting:   return "connecting";
        case LinkState::Connected:    return "connected";
        case LinkState::Disconnected: return "disconnected";
        case LinkState::Failed:       return "failed";
        case LinkState::Closed:       return "closed";
        }
        return "?";
    }

    void EventQueue::Push(NegotiationEvent ev) {
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Events.push_back(std::move(ev));
        }
        m_Cv.notify_all();
    }

    void EventQueue::Push(EventKind kind, std::string text) {
        NegotiationEvent ev;
        ev.kind = kind;
        ev.text = std::move(text);
        Push(std::move(ev));
    }

    void EventQueue::SetLinkState(LinkState state) {
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            // Terminal states stick; a late "connecting" must not resurrect a dead link.
            if (IsLinkLost(m_Link) && !IsLinkLost(state)) return;
            m_Link = state;
            if (state == LinkState::Connected) m_WasConnected = true;
        }
        m_Cv.notify_all();
    }

    LinkState EventQueue::GetLinkState() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Link;
    }

    bool EventQueue::TakeLocked(std::initializer_list<EventKind> kinds, NegotiationEvent& out) {
        auto it = std::find_if(m_Events.begin(), m_Events.end(), [&](const NegotiationEvent& ev) {
            return std::find(kinds.begin(), kinds.end(), ev.kind) != kinds.end();
        });
        if (it == m_Events.end()) return false;
        out = std::move(*it);
        m_Events.erase(it);
        return true;
    }

    WaitStatus EventQueue::WaitFor(std::initializer_list<EventKind> kinds, Clock::time_point deadline,
        NegotiationEvent& out) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        for (;;) {
            if (TakeLocked(kinds, out)) return WaitStatus::Ready;
            if (IsLinkLost(m_Link)) return WaitStatus::LinkLost;
            if (m_Cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                if (TakeLocked(kinds, out)) return WaitStatus::Ready;
                return IsLinkLost(m_Link) ? WaitStatus::LinkLost : WaitStatus::TimedOut;
            }
        }
    }

    WaitStatus EventQueue::WaitForConnected(Clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        const bool done = m_Cv.wait_until(lock, deadline, [this] {
            return m_WasConnected || IsLinkLost(m_Link);
        });
        if (!done) return WaitStatus::TimedOut;
        return m_WasConnected ? WaitStatus::Ready : WaitStatus::LinkLost;
    }

    size_t EventQueue::Pending() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Events.size();
    }

} // namespace PeerBeam
