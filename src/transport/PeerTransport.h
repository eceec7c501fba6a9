#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace PeerBeam {

    // Label both peers agree on; the sender creates it, the receiver accepts it.
    constexpr const char* kFileChannelLabel = "fileTransfer";

    struct SessionDescription {
        std::string type; // "offer" | "answer"
        std::string sdp;
    };

    // base64(JSON {"type","sdp"}). Decode throws ProtocolError(MalformedMessage).
    std::string EncodeSessionDescription(const SessionDescription& desc);
    SessionDescription DecodeSessionDescription(const std::string& blob);

    // Ordered, reliable message channel negotiated by a PeerTransport.
    class DataChannel {
    public:
        virtual ~DataChannel() = default;

        virtual std::string Label() const = 0;
        virtual bool IsOpen() const = 0;
        // May block while the send buffer drains. Returns false when the
        // channel is closed or the buffer never drained.
        virtual bool Send(const uint8_t* data, size_t len) = 0;
        virtual void Close() = 0;

        bool Send(const std::string& text) {
            return Send(reinterpret_cast<const uint8_t*>(text.data()), text.size());
        }
    };

    // The connectivity engine (ICE, DTLS, SCTP) seen as a black box. All
    // progress is reported through the EventQueue given at construction:
    // GatheringComplete, ChannelOpen, ChannelMessage, ChannelClosed and the
    // link state.
    class PeerTransport {
    public:
        virtual ~PeerTransport() = default;

        // Sender side, before the offer is created.
        virtual void CreateDataChannel(const std::string& label) = 0;
        // Offer when no remote description is set yet, answer otherwise.
        // Candidate gathering starts here.
        virtual void CreateLocalDescription() = 0;
        virtual void ApplyRemoteDescription(const SessionDescription& desc) = 0;
        // Whatever has been gathered so far.
        virtual SessionDescription LocalDescription() const = 0;
        // Null until created (sender) or announced by the remote (receiver).
        virtual std::shared_ptr<DataChannel> Channel() const = 0;
        // Waits briefly for pending outbound data before tearing down.
        virtual void Close() = 0;
    };

} // namespace PeerBeam
