#include "SignalMessage.h"
#include "../core/Errors.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

    struct TypeName {
        PeerBeam::SignalType type;
        const char*          name;
    };

    constexpr TypeName kTypeNames[] = {
        { PeerBeam::SignalType::CreateRoom,  "create_room" },
        { PeerBeam::SignalType::JoinRoom,    "join_room" },
        { PeerBeam::SignalType::Offer,       "offer" },
        { PeerBeam::SignalType::Answer,      "answer" },
        { PeerBeam::SignalType::PeerJoined,  "peer_joined" },
        { PeerBeam::SignalType::PeerLeft,    "peer_left" },
        { PeerBeam::SignalType::RoomCreated, "room_created" },
        { PeerBeam::SignalType::RoomJoined,  "room_joined" },
        { PeerBeam::SignalType::Error,       "error" },
    };

    std::string StringField(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return {};
        if (!it->is_string())
            throw PeerBeam::ProtocolError(PeerBeam::SignalErrorCode::MalformedMessage,
                std::string("invalid message format: field '") + key + "' is not a string");
        return it->get<std::string>();
    }

} // namespace

namespace PeerBeam {

    const char* SignalTypeName(SignalType type) {
        for (const auto& entry : kTypeNames)
            if (entry.type == type) return entry.name;
        return "";
    }

    SignalType SignalTypeFromName(const std::string& name) {
        for (const auto& entry : kTypeNames)
            if (name == entry.name) return entry.type;
        return SignalType::Unknown;
    }

    SignalMessage SignalMessage::Parse(const std::string& body) {
        json j;
        try {
            j = json::parse(body);
        }
        catch (const json::parse_error& e) {
            throw ProtocolError(SignalErrorCode::MalformedMessage,
                std::string("invalid message format: ") + e.what());
        }
        if (!j.is_object())
            throw ProtocolError(SignalErrorCode::MalformedMessage, "invalid message format: not an object");

        SignalMessage msg;
        msg.rawType = StringField(j, "type");
        msg.type = SignalTypeFromName(msg.rawType);
        msg.roomId = StringField(j, "room_id");
        msg.fileId = StringField(j, "file_id");
        msg.sdp = StringField(j, "sdp");
        msg.error = StringField(j, "error");
        msg.clientType = StringField(j, "client_type");
        return msg;
    }

    std::string SignalMessage::Serialize() const {
        json j;
        j["type"] = type == SignalType::Unknown ? rawType : std::string(SignalTypeName(type));
        if (!roomId.empty()) j["room_id"] = roomId;
        if (!fileId.empty()) j["file_id"] = fileId;
        if (!sdp.empty()) j["sdp"] = sdp;
        if (!error.empty()) j["error"] = error;
        if (!clientType.empty()) j["client_type"] = clientType;
        return j.dump();
    }

    SignalMessage SignalMessage::Make(SignalType type, const std::string& roomId) {
        SignalMessage msg;
        msg.type = type;
        msg.rawType = SignalTypeName(type);
        msg.roomId = roomId;
        return msg;
    }

    SignalMessage SignalMessage::MakeError(const std::string& text) {
        SignalMessage msg = Make(SignalType::Error);
        msg.error = text;
        return msg;
    }

} // namespace PeerBeam
