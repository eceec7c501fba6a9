#pragma once
#include "PeerTransport.h"
#include "../negotiation/EventQueue.h"
#include <rtc/rtc.hpp>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PeerBeam {

    // DataChannel over an rtc::DataChannel with send-side pacing: Send()
    // blocks while more than kHighWatermark bytes are buffered.
    class RtcDataChannel : public DataChannel {
    public:
        RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel, EventQueue& events);
        ~RtcDataChannel() override;

        std::string Label() const override;
        bool IsOpen() const override;
        bool Send(const uint8_t* data, size_t len) override;
        void Close() override;

        size_t BufferedAmount() const;
        // Waits until everything queued has been handed to the transport.
        bool Drain(std::chrono::milliseconds timeout);
        void Detach();

    private:
        static constexpr size_t kHighWatermark = 1024 * 1024;
        static constexpr size_t kLowWatermark = 256 * 1024;
        static constexpr auto   kDrainTimeout = std::chrono::seconds(30);

        std::shared_ptr<rtc::DataChannel> m_Channel;
        std::mutex                        m_Mutex;
        std::condition_variable           m_Cv;
        bool                              m_Closed = false;
    };

    class RtcPeerTransport : public PeerTransport {
    public:
        RtcPeerTransport(const std::vector<std::string>& iceServers, EventQueue& events);
        ~RtcPeerTransport() override;

        void CreateDataChannel(const std::string& label) override;
        void CreateLocalDescription() override;
        void ApplyRemoteDescription(const SessionDescription& desc) override;
        SessionDescription LocalDescription() const override;
        std::shared_ptr<DataChannel> Channel() const override;
        void Close() override;

    private:
        void AttachChannel(std::shared_ptr<rtc::DataChannel> channel);

        EventQueue&                          m_Events;
        std::shared_ptr<rtc::PeerConnection> m_Connection;
        mutable std::mutex                   m_ChannelMutex;
        std::shared_ptr<RtcDataChannel>      m_Channel;
        bool                                 m_Closed = false;
    };

} // namespace PeerBeam
