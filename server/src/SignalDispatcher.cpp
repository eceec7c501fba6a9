#include "SignalDispatcher.h"
#include "Room.h"
#include "core/Logger.h"

namespace PeerBeam {

    SignalDispatcher::SignalDispatcher(RoomRegistry& rooms) : m_Rooms(rooms) {}

    void SignalDispatcher::Dispatch(const std::shared_ptr<RoomMember>& from, const std::string& body) {
        SignalMessage msg;
        try {
            msg = SignalMessage::Parse(body);
        }
        catch (const ProtocolError& e) {
            LOG_WARN(from->Describe() + ": " + e.what());
            ReplyError(from, SignalErrorText(SignalErrorCode::MalformedMessage));
            return;
        }
        Dispatch(from, msg);
    }

    void SignalDispatcher::Dispatch(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg) {
        switch (msg.type) {
        case SignalType::CreateRoom: HandleCreateRoom(from, msg); break;
        case SignalType::JoinRoom:   HandleJoinRoom(from, msg);   break;
        case SignalType::Offer:      HandleOffer(from, msg);      break;
        case SignalType::Answer:     HandleAnswer(from, msg);     break;
        default:
            LOG_WARN(from->Describe() + ": unknown message type '" + msg.rawType + "'");
            ReplyError(from, std::string(SignalErrorText(SignalErrorCode::UnknownType)) + ": " + msg.rawType);
            break;
        }
    }

    void SignalDispatcher::HandleCreateRoom(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg) {
        if (msg.roomId.empty()) { ReplyError(from, SignalErrorText(SignalErrorCode::InvalidRoomId)); return; }
        if (from->CurrentRoom()) { ReplyError(from, SignalErrorText(SignalErrorCode::AlreadyInRoom)); return; }

        std::shared_ptr<Room> room;
        try {
            room = m_Rooms.CreateAndEnter(msg.roomId, from);
        }
        catch (const ProtocolError&) {
            ReplyError(from, SignalErrorText(SignalErrorCode::RoomExists));
            return;
        }
        from->AssignRoom(room, ClientRole::Sender);
        LOG_SIGNAL("room " + msg.roomId + " created by " + from->Describe());

        SignalMessage reply = SignalMessage::Make(SignalType::RoomCreated, msg.roomId);
        reply.clientType = ClientRoleName(ClientRole::Sender);
        from->Deliver(reply);
    }

    void SignalDispatcher::HandleJoinRoom(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg) {
        if (msg.roomId.empty()) { ReplyError(from, SignalErrorText(SignalErrorCode::InvalidRoomId)); return; }
        if (from->CurrentRoom()) { ReplyError(from, SignalErrorText(SignalErrorCode::AlreadyInRoom)); return; }

        auto room = m_Rooms.Enter(msg.roomId, from);
        if (!room) { ReplyError(from, SignalErrorText(SignalErrorCode::RoomNotFound)); return; }

        from->AssignRoom(room, ClientRole::Receiver);
        LOG_SIGNAL(from->Describe() + " joined room " + msg.roomId);

        SignalMessage reply = SignalMessage::Make(SignalType::RoomJoined, msg.roomId);
        reply.clientType = ClientRoleName(ClientRole::Receiver);
        from->Deliver(reply);

        room->Broadcast(SignalMessage::Make(SignalType::PeerJoined, msg.roomId), from.get());
    }

    void SignalDispatcher::HandleOffer(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg) {
        auto room = from->CurrentRoom();
        if (!room) { ReplyError(from, SignalErrorText(SignalErrorCode::NotInRoom)); return; }
        if (from->Role() != ClientRole::Sender) { ReplyError(from, SignalErrorText(SignalErrorCode::WrongRole)); return; }

        SignalMessage relay = SignalMessage::Make(SignalType::Offer, room->Id());
        relay.fileId = msg.fileId;
        relay.sdp = msg.sdp;
        room->Broadcast(relay, from.get());
        LOG_SIGNAL("offer relayed in room " + room->Id());
    }

    void SignalDispatcher::HandleAnswer(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg) {
        auto room = from->CurrentRoom();
        if (!room) { ReplyError(from, SignalErrorText(SignalErrorCode::NotInRoom)); return; }
        if (from->Role() != ClientRole::Receiver) { ReplyError(from, SignalErrorText(SignalErrorCode::WrongRole)); return; }

        SignalMessage relay = SignalMessage::Make(SignalType::Answer, room->Id());
        relay.sdp = msg.sdp;
        room->Broadcast(relay, from.get());
        LOG_SIGNAL("answer relayed in room " + room->Id());
    }

    void SignalDispatcher::Leave(const std::shared_ptr<RoomMember>& member) {
        auto room = member->CurrentRoom();
        if (!room) return;
        member->ClearRoom();

        if (m_Rooms.Leave(room, member)) {
            room->Broadcast(SignalMessage::Make(SignalType::PeerLeft, room->Id()), member.get());
            LOG_SIGNAL(member->Describe() + " left room " + room->Id());
        }
        else {
            LOG_SIGNAL("room " + room->Id() + " is empty, removed");
        }
    }

    void SignalDispatcher::ReplyError(const std::shared_ptr<RoomMember>& to, const std::string& text) {
        to->Deliver(SignalMessage::MakeError(text));
    }

} // namespace PeerBeam
