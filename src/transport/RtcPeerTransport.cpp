#include "RtcPeerTransport.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include <cstddef>
#include <cstring>
#include <variant>

namespace {

    PeerBeam::LinkState MapIceState(rtc::PeerConnection::IceState state) {
        using Ice = rtc::PeerConnection::IceState;
        switch (state) {
        case Ice::New:          return PeerBeam::LinkState::New;
        case Ice::Checking:     return PeerBeam::LinkState::Connecting;
        case Ice::Connected:
        case Ice::Completed:    return PeerBeam::LinkState::Connected;
        case Ice::Disconnected: return PeerBeam::LinkState::Disconnected;
        case Ice::Failed:       return PeerBeam::LinkState::Failed;
        case Ice::Closed:       return PeerBeam::LinkState::Closed;
        }
        return PeerBeam::LinkState::New;
    }

} // namespace

namespace PeerBeam {

    // ---------------------------------------------------------------------------
    // RtcDataChannel
    // ---------------------------------------------------------------------------

    RtcDataChannel::RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel, EventQueue& events)
        : m_Channel(std::move(channel)) {
        m_Channel->setBufferedAmountLowThreshold(kLowWatermark);

        m_Channel->onOpen([&events, label = m_Channel->label()]() {
            LOG_NEGOTIATE("data channel '" + label + "' open");
            events.Push(EventKind::ChannelOpen, label);
        });
        m_Channel->onClosed([this, &events]() {
            {
                std::lock_guard<std::mutex> lock(m_Mutex);
                m_Closed = true;
            }
            m_Cv.notify_all();
            events.Push(EventKind::ChannelClosed);
        });
        m_Channel->onBufferedAmountLow([this]() {
            // Taken so the wakeup cannot slip between Send's predicate and its wait.
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Cv.notify_all();
        });
        m_Channel->onMessage([&events](rtc::message_variant data) {
            NegotiationEvent ev;
            ev.kind = EventKind::ChannelMessage;
            if (const auto* bin = std::get_if<rtc::binary>(&data)) {
                ev.payload.resize(bin->size());
                if (!bin->empty()) std::memcpy(ev.payload.data(), bin->data(), bin->size());
            }
            else {
                const auto& text = std::get<rtc::string>(data);
                ev.payload.assign(text.begin(), text.end());
            }
            events.Push(std::move(ev));
        });
    }

    RtcDataChannel::~RtcDataChannel() {
        Detach();
    }

    void RtcDataChannel::Detach() {
        m_Channel->resetCallbacks();
        {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Closed = true;
        }
        m_Cv.notify_all();
    }

    std::string RtcDataChannel::Label() const { return m_Channel->label(); }

    bool RtcDataChannel::IsOpen() const { return m_Channel->isOpen(); }

    size_t RtcDataChannel::BufferedAmount() const { return m_Channel->bufferedAmount(); }

    bool RtcDataChannel::Send(const uint8_t* data, size_t len) {
        {
            std::unique_lock<std::mutex> lock(m_Mutex);
            const bool ready = m_Cv.wait_for(lock, kDrainTimeout, [this] {
                return m_Closed || m_Channel->bufferedAmount() <= kHighWatermark;
            });
            if (!ready) {
                LOG_WARN("data channel send buffer did not drain");
                return false;
            }
            if (m_Closed) return false;
        }
        try {
            // false only means "buffered", which the watermark above accounts for
            m_Channel->send(reinterpret_cast<const std::byte*>(data), len);
            return true;
        }
        catch (const std::exception& e) {
            LOG_WARN(std::string("data channel send failed: ") + e.what());
            return false;
        }
    }

    bool RtcDataChannel::Drain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_Mutex);
        // onBufferedAmountLow only fires at the threshold; poll below it.
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!m_Closed && m_Channel->bufferedAmount() > 0) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            m_Cv.wait_for(lock, std::chrono::milliseconds(50));
        }
        return true;
    }

    void RtcDataChannel::Close() {
        try {
            m_Channel->close();
        }
        catch (const std::exception& e) {
            LOG_WARN(std::string("data channel close: ") + e.what());
        }
    }

    // ---------------------------------------------------------------------------
    // RtcPeerTransport
    // ---------------------------------------------------------------------------

    RtcPeerTransport::RtcPeerTransport(const std::vector<std::string>& iceServers, EventQueue& events)
        : m_Events(events) {
        rtc::Configuration config;
        // The negotiator decides when descriptions are created.
        config.disableAutoNegotiation = true;
        for (const auto& server : iceServers) {
            try {
                config.iceServers.emplace_back(server);
            }
            catch (const std::exception& e) {
                throw std::runtime_error("invalid ICE server '" + server + "': " + e.what());
            }
        }

        m_Connection = std::make_shared<rtc::PeerConnection>(config);

        m_Connection->onGatheringStateChange([this](rtc::PeerConnection::GatheringState state) {
            if (state == rtc::PeerConnection::GatheringState::Complete) {
                LOG_NEGOTIATE("candidate gathering complete");
                m_Events.Push(EventKind::GatheringComplete);
            }
        });
        m_Connection->onIceStateChange([this](rtc::PeerConnection::IceState state) {
            const LinkState link = MapIceState(state);
            LOG_NEGOTIATE(std::string("connection state: ") + LinkStateName(link));
            m_Events.SetLinkState(link);
        });
        m_Connection->onStateChange([this](rtc::PeerConnection::State state) {
            if (state == rtc::PeerConnection::State::Failed) m_Events.SetLinkState(LinkState::Failed);
            else if (state == rtc::PeerConnection::State::Closed) m_Events.SetLinkState(LinkState::Closed);
        });
        m_Connection->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
            LOG_NEGOTIATE("remote announced data channel '" + channel->label() + "'");
            if (channel->label() != kFileChannelLabel) {
                LOG_WARN("ignoring unexpected data channel '" + channel->label() + "'");
                return;
            }
            AttachChannel(std::move(channel));
        });
    }

    RtcPeerTransport::~RtcPeerTransport() {
        Close();
    }

    void RtcPeerTransport::AttachChannel(std::shared_ptr<rtc::DataChannel> channel) {
        auto wrapped = std::make_shared<RtcDataChannel>(channel, m_Events);
        bool alreadyOpen = channel->isOpen();
        {
            std::lock_guard<std::mutex> lock(m_ChannelMutex);
            m_Channel = wrapped;
        }
        // onOpen will not fire again for a channel that opened before we attached.
        if (alreadyOpen) m_Events.Push(EventKind::ChannelOpen, channel->label());
    }

    void RtcPeerTransport::CreateDataChannel(const std::string& label) {
        rtc::DataChannelInit init; // reliable and ordered by default
        AttachChannel(m_Connection->createDataChannel(label, init));
    }

    void RtcPeerTransport::CreateLocalDescription() {
        m_Connection->setLocalDescription();
    }

    void RtcPeerTransport::ApplyRemoteDescription(const SessionDescription& desc) {
        try {
            m_Connection->setRemoteDescription(rtc::Description(desc.sdp, desc.type));
        }
        catch (const std::exception& e) {
            throw ProtocolError(SignalErrorCode::MalformedMessage,
                std::string("remote description rejected: ") + e.what());
        }
    }

    SessionDescription RtcPeerTransport::LocalDescription() const {
        auto desc = m_Connection->localDescription();
        if (!desc) return {};
        return { desc->typeString(), std::string(*desc) };
    }

    std::shared_ptr<DataChannel> RtcPeerTransport::Channel() const {
        std::lock_guard<std::mutex> lock(m_ChannelMutex);
        return m_Channel;
    }

    void RtcPeerTransport::Close() {
        if (m_Closed) return;
        m_Closed = true;

        std::shared_ptr<RtcDataChannel> channel;
        {
            std::lock_guard<std::mutex> lock(m_ChannelMutex);
            channel = m_Channel;
        }
        if (channel) {
            if (!channel->Drain(std::chrono::seconds(2)))
                LOG_WARN("closing with undelivered data channel bytes");
            channel->Detach();
        }
        m_Connection->resetCallbacks();
        m_Connection->close();
    }

} // namespace PeerBeam
