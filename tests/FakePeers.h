#pragma once
#include "negotiation/DescriptionExchange.h"
#include "negotiation/EventQueue.h"
#include "transport/PeerTransport.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PeerBeam::Testing {

    // ---------------------------------------------------------------------------
    // In-memory data channel. Messages go to the peer's queue when wired,
    // and are always recorded.
    // ---------------------------------------------------------------------------
    class FakeDataChannel : public DataChannel {
    public:
        void Wire(EventQueue* peer) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Peer = peer;
        }

        std::string Label() const override { return kFileChannelLabel; }

        bool IsOpen() const override {
            std::lock_guard<std::mutex> lock(m_Mutex);
            return !m_Closed;
        }

        // Pushes happen under the channel lock so that Wire(nullptr) is a
        // barrier: nothing reaches a queue after its owner detached.
        bool Send(const uint8_t* data, size_t len) override {
            NegotiationEvent ev;
            ev.kind = EventKind::ChannelMessage;
            ev.payload.assign(data, data + len);
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_Closed) return false;
            m_Sent.push_back(ev.payload);
            if (m_Peer) m_Peer->Push(std::move(ev));
            return true;
        }
        using DataChannel::Send;

        void Close() override {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (m_Closed) return;
            m_Closed = true;
            if (m_Peer) {
                m_Peer->Push(EventKind::ChannelClosed);
                m_Peer->SetLinkState(LinkState::Closed);
            }
        }

        std::vector<std::vector<uint8_t>> Sent() const {
            std::lock_guard<std::mutex> lock(m_Mutex);
            return m_Sent;
        }

    private:
        mutable std::mutex                m_Mutex;
        EventQueue*                       m_Peer = nullptr;
        bool                              m_Closed = false;
        std::vector<std::vector<uint8_t>> m_Sent;
    };

    // ---------------------------------------------------------------------------
    // Scriptable transport. Alone it connects as soon as a remote description
    // is applied; linked to a partner it connects once both sides have one.
    // ---------------------------------------------------------------------------
    class FakeTransport : public PeerTransport {
    public:
        struct Pairing {
            std::mutex     mutex;
            FakeTransport* sides[2] = { nullptr, nullptr };
        };

        explicit FakeTransport(EventQueue& events)
            : m_Events(events), m_Channel(std::make_shared<FakeDataChannel>()) {}

        ~FakeTransport() override { Detach(); }

        static void Link(FakeTransport& a, FakeTransport& b) {
            auto pairing = std::make_shared<Pairing>();
            pairing->sides[0] = &a;
            pairing->sides[1] = &b;
            a.m_Pairing = pairing;
            b.m_Pairing = pairing;
        }

        bool emitGathering = true;
        bool connectOnRemote = true;
        bool failOnRemote = false;
        bool openChannel = true;

        void CreateDataChannel(const std::string&) override { m_Announced = true; }

        void CreateLocalDescription() override {
            m_Local.type = m_HasRemote ? "answer" : "offer";
            m_Local.sdp = "v=0\r\no=- 0 0 IN IP4 127.0.0.1\r\ns=" + m_Local.type + "\r\n";
            m_Events.SetLinkState(LinkState::Connecting);
            if (emitGathering) m_Events.Push(EventKind::GatheringComplete);
        }

        void ApplyRemoteDescription(const SessionDescription& desc) override {
            appliedRemote = desc;
            m_Announced = true;
            if (failOnRemote) {
                m_HasRemote = true;
                m_Events.SetLinkState(LinkState::Failed);
                return;
            }
            if (m_Pairing) {
                std::lock_guard<std::mutex> lock(m_Pairing->mutex);
                m_HasRemote = true;
                FakeTransport* other = OtherLocked();
                if (!other || !other->m_HasRemote) return;
                m_Channel->Wire(&other->m_Events);
                other->m_Channel->Wire(&m_Events);
                Connect();
                other->Connect();
                return;
            }
            m_HasRemote = true;
            if (connectOnRemote) Connect();
        }

        SessionDescription LocalDescription() const override { return m_Local; }

        std::shared_ptr<DataChannel> Channel() const override {
            return m_Announced ? m_Channel : nullptr;
        }

        void Close() override {
            closed = true;
            Detach();
            m_Channel->Close();
            m_Events.SetLinkState(LinkState::Closed);
        }

        std::shared_ptr<FakeDataChannel> FakeChannel() const { return m_Channel; }

        SessionDescription appliedRemote;
        bool               closed = false;

    private:
        FakeTransport* OtherLocked() const {
            return m_Pairing->sides[0] == this ? m_Pairing->sides[1] : m_Pairing->sides[0];
        }

        // Stops the partner from pushing into our queue.
        void Detach() {
            if (!m_Pairing) return;
            std::lock_guard<std::mutex> lock(m_Pairing->mutex);
            if (FakeTransport* other = OtherLocked()) other->m_Channel->Wire(nullptr);
            for (auto& side : m_Pairing->sides)
                if (side == this) side = nullptr;
        }

        void Connect() {
            m_Events.SetLinkState(LinkState::Connected);
            if (openChannel) m_Events.Push(EventKind::ChannelOpen);
        }

        EventQueue&                            m_Events;
        const std::shared_ptr<FakeDataChannel> m_Channel;
        std::shared_ptr<Pairing>               m_Pairing;
        SessionDescription                     m_Local;
        bool                                   m_HasRemote = false;
        bool                                   m_Announced = false;
    };

    // ---------------------------------------------------------------------------
    // In-memory stand-in for the broker. Both peers share one hub; a receiver
    // that joins before the room exists is let in once it is created.
    // ---------------------------------------------------------------------------
    struct ExchangeHub {
        std::mutex  mutex;
        EventQueue* sender = nullptr;
        EventQueue* receiver = nullptr;
        bool        roomCreated = false;
        bool        receiverWaiting = false;
        std::string pendingOffer, pendingFileId;
        std::vector<std::string> offers, answers;
        std::vector<std::string> rooms;
    };

    class FakeExchange : public DescriptionExchange {
    public:
        FakeExchange(std::shared_ptr<ExchangeHub> hub, bool isSender)
            : m_Hub(std::move(hub)), m_IsSender(isSender) {}

        void Start(EventQueue& events) override {
            std::lock_guard<std::mutex> lock(m_Hub->mutex);
            if (m_IsSender) {
                m_Hub->sender = &events;
                return;
            }
            m_Hub->receiver = &events;
            if (!m_Hub->pendingOffer.empty()) {
                DeliverOfferLocked(m_Hub->pendingOffer, m_Hub->pendingFileId);
                m_Hub->pendingOffer.clear();
            }
        }

        bool UsesRoom() const override { return true; }

        void CreateRoom(const std::string& roomId) override {
            std::lock_guard<std::mutex> lock(m_Hub->mutex);
            m_Hub->rooms.push_back(roomId);
            m_Hub->roomCreated = true;
            m_Hub->sender->Push(EventKind::RoomReady);
            if (m_Hub->receiverWaiting) {
                m_Hub->receiverWaiting = false;
                m_Hub->receiver->Push(EventKind::RoomReady);
                m_Hub->sender->Push(EventKind::PeerJoined);
            }
        }

        void JoinRoom(const std::string& roomId) override {
            std::lock_guard<std::mutex> lock(m_Hub->mutex);
            m_Hub->rooms.push_back(roomId);
            if (!m_Hub->roomCreated) {
                m_Hub->receiverWaiting = true;
                return;
            }
            m_Hub->receiver->Push(EventKind::RoomReady);
            if (m_Hub->sender) m_Hub->sender->Push(EventKind::PeerJoined);
        }

        void PublishOffer(const std::string&, const std::string& fileId, const std::string& blob) override {
            std::lock_guard<std::mutex> lock(m_Hub->mutex);
            m_Hub->offers.push_back(blob);
            if (!m_Hub->receiver) {
                m_Hub->pendingOffer = blob;
                m_Hub->pendingFileId = fileId;
                return;
            }
            DeliverOfferLocked(blob, fileId);
        }

        void PublishAnswer(const std::string&, const std::string& blob) override {
            std::lock_guard<std::mutex> lock(m_Hub->mutex);
            m_Hub->answers.push_back(blob);
            NegotiationEvent ev;
            ev.kind = EventKind::RemoteDescription;
            ev.text = blob;
            if (m_Hub->sender) m_Hub->sender->Push(std::move(ev));
        }

        void RequestRemoteDescription() override {}
        void Close() override { closed = true; }

        bool closed = false;

    private:
        void DeliverOfferLocked(const std::string& blob, const std::string& fileId) {
            NegotiationEvent ev;
            ev.kind = EventKind::RemoteDescription;
            ev.text = blob;
            ev.fileId = fileId;
            m_Hub->receiver->Push(std::move(ev));
        }

        std::shared_ptr<ExchangeHub> m_Hub;
        bool                         m_IsSender;
    };

} // namespace PeerBeam::Testing
