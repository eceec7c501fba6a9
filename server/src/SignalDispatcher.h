#pragma once
#include "RoomMember.h"
#include "RoomRegistry.h"
#include "core/Errors.h"
#include <memory>
#include <string>

namespace PeerBeam {

    // Routes one decoded signaling frame for one member. Protocol errors are
    // answered with an `error` message and never terminate the connection.
    class SignalDispatcher {
    public:
        explicit SignalDispatcher(RoomRegistry& rooms);

        void Dispatch(const std::shared_ptr<RoomMember>& from, const std::string& body);
        void Dispatch(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg);

        // Called once when a member's connection terminates for any reason.
        void Leave(const std::shared_ptr<RoomMember>& member);

    private:
        void HandleCreateRoom(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg);
        void HandleJoinRoom(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg);
        void HandleOffer(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg);
        void HandleAnswer(const std::shared_ptr<RoomMember>& from, const SignalMessage& msg);

        static void ReplyError(const std::shared_ptr<RoomMember>& to, const std::string& text);

        RoomRegistry& m_Rooms;
    };

} // namespace PeerBeam
