#include "PeerTransport.h"
#include "../core/Errors.h"
#include "../shared/Encoding.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace PeerBeam {

    std::string EncodeSessionDescription(const SessionDescription& desc) {
        json j;
        j["type"] = desc.type;
        j["sdp"] = desc.sdp;
        return EncodeBase64(j.dump());
    }

    SessionDescription DecodeSessionDescription(const std::string& blob) {
        std::string raw;
        if (blob.empty() || !DecodeBase64(blob, raw))
            throw ProtocolError(SignalErrorCode::MalformedMessage, "session description is not valid base64");
        try {
            json j = json::parse(raw);
            SessionDescription desc;
            desc.type = j.at("type").get<std::string>();
            desc.sdp = j.at("sdp").get<std::string>();
            if (desc.type != "offer" && desc.type != "answer")
                throw ProtocolError(SignalErrorCode::MalformedMessage,
                    "unexpected session description type '" + desc.type + "'");
            return desc;
        }
        catch (const json::exception& e) {
            throw ProtocolError(SignalErrorCode::MalformedMessage,
                std::string("session description is not valid JSON: ") + e.what());
        }
    }

} // namespace PeerBeam
