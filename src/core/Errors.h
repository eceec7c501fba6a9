#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace PeerBeam {

    // Reasons the signaling broker refuses a request. Sent back to the
    // offending client as an `error` message; the connection stays up.
    enum class SignalErrorCode {
        InvalidRoomId,
        RoomExists,
        DuplicateRoom,
        RoomNotFound,
        NotInRoom,
        AlreadyInRoom,
        WrongRole,
        UnknownType,
        MalformedMessage
    };

    inline const char* SignalErrorText(SignalErrorCode code) {
        switch (code) {
        case SignalErrorCode::InvalidRoomId:    return "room id must not be empty";
        case SignalErrorCode::RoomExists:       return "room already exists";
        case SignalErrorCode::DuplicateRoom:    return "duplicate room id";
        case SignalErrorCode::RoomNotFound:     return "room not found";
        case SignalErrorCode::NotInRoom:        return "not in a room";
        case SignalErrorCode::AlreadyInRoom:    return "already in a room";
        case SignalErrorCode::WrongRole:        return "operation not allowed for this role";
        case SignalErrorCode::UnknownType:      return "unknown message type";
        case SignalErrorCode::MalformedMessage: return "invalid message format";
        }
        return "unknown error";
    }

    class ProtocolError : public std::runtime_error {
    public:
        ProtocolError(SignalErrorCode code, const std::string& detail)
            : std::runtime_error(detail), m_Code(code) {}
        explicit ProtocolError(SignalErrorCode code)
            : std::runtime_error(SignalErrorText(code)), m_Code(code) {}

        SignalErrorCode Code() const { return m_Code; }

    private:
        SignalErrorCode m_Code;
    };

    // Socket level failure on the signaling link.
    class TransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Connectivity failure or negotiation timeout. Always fatal to the
    // current transfer attempt.
    class NegotiationError : public std::runtime_error {
    public:
        NegotiationError(std::string phase, std::chrono::milliseconds elapsed,
            bool timedOut, const std::string& reason)
            : std::runtime_error(Format(phase, elapsed, reason))
            , m_Phase(std::move(phase)), m_Elapsed(elapsed), m_TimedOut(timedOut) {}

        const std::string& Phase() const { return m_Phase; }
        std::chrono::milliseconds Elapsed() const { return m_Elapsed; }
        bool TimedOut() const { return m_TimedOut; }

    private:
        static std::string Format(const std::string& phase,
            std::chrono::milliseconds elapsed, const std::string& reason) {
            return phase + " failed after " + std::to_string(elapsed.count()) + "ms: " + reason;
        }

        std::string               m_Phase;
        std::chrono::milliseconds m_Elapsed;
        bool                      m_TimedOut;
    };

    class TransferError : public std::runtime_error {
    public:
        enum class Kind { Decode, Io, ProtocolViolation, ChannelClosed, Timeout };

        TransferError(Kind kind, const std::string& what)
            : std::runtime_error(what), m_Kind(kind) {}

        Kind GetKind() const { return m_Kind; }

    private:
        Kind m_Kind;
    };

} // namespace PeerBeam
