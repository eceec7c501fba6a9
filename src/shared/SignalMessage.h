#pragma once
#include <string>

namespace PeerBeam {

    enum class SignalType {
        CreateRoom,
        JoinRoom,
        Offer,
        Answer,
        PeerJoined,
        PeerLeft,
        RoomCreated,
        RoomJoined,
        Error,
        Unknown
    };

    const char* SignalTypeName(SignalType type);
    SignalType SignalTypeFromName(const std::string& name);

    // One JSON object per signaling frame. Optional fields are left empty
    // when absent and are omitted again on the wire.
    struct SignalMessage {
        SignalType  type = SignalType::Unknown;
        std::string rawType;     // as received; kept for "unknown type" replies
        std::string roomId;
        std::string fileId;
        std::string sdp;         // opaque base64 session description
        std::string error;
        std::string clientType;  // "sender" | "receiver"

        // Throws ProtocolError(MalformedMessage) when the body is not a JSON object.
        static SignalMessage Parse(const std::string& body);
        std::string Serialize() const;

        static SignalMessage Make(SignalType type, const std::string& roomId = {});
        static SignalMessage MakeError(const std::string& text);
    };

} // namespace PeerBeam
