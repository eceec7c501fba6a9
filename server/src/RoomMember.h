#pragma once
#include "shared/SignalMessage.h"
#include <memory>
#include <string>

namespace PeerBeam {

    class Room;

    enum class ClientRole { None, Sender, Receiver };

    inline const char* ClientRoleName(ClientRole role) {
        switch (role) {
        case ClientRole::Sender:   return "sender";
        case ClientRole::Receiver: return "receiver";
        default:                   return "";
        }
    }

    // A connection as seen by the room logic. SignalSession is the socket
    // backed implementation; tests plug in their own.
    //
    // Role and room are written only from the member's own read loop.
    class RoomMember {
    public:
        virtual ~RoomMember() = default;

        // Never blocks. A member whose outbound queue is full closes itself.
        virtual void Deliver(const SignalMessage& msg) = 0;
        virtual void Close() = 0;
        virtual std::string Describe() const = 0;

        ClientRole Role() const { return m_Role; }
        std::shared_ptr<Room> CurrentRoom() const { return m_Room.lock(); }

        void AssignRoom(const std::shared_ptr<Room>& room, ClientRole role) {
            m_Room = room;
            m_Role = role;
        }
        void ClearRoom() { m_Room.reset(); }

    private:
        ClientRole          m_Role = ClientRole::None;
        std::weak_ptr<Room> m_Room;
    };

} // namespace PeerBeam
