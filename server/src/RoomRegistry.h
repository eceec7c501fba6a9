#pragma once
#include "Room.h"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace PeerBeam {

    // Owned by one SignalingServer. Lookups take the shared lock, creation,
    // removal and membership changes take the exclusive lock so a room can
    // never be joined after its last member left.
    class RoomRegistry {
    public:
        // Throws ProtocolError(DuplicateRoom) when the id is taken.
        std::shared_ptr<Room> CreateRoom(const std::string& id);
        std::shared_ptr<Room> GetRoom(const std::string& id) const;
        bool RemoveRoom(const std::string& id);

        // Creates the room with `member` as its first occupant.
        std::shared_ptr<Room> CreateAndEnter(const std::string& id,
            const std::shared_ptr<RoomMember>& member);
        // Returns null when no such room exists; never creates one.
        std::shared_ptr<Room> Enter(const std::string& id,
            const std::shared_ptr<RoomMember>& member);
        // Returns true when the room still has members afterwards.
        bool Leave(const std::shared_ptr<Room>& room,
            const std::shared_ptr<RoomMember>& member);

        size_t RoomCount() const;

    private:
        mutable std::shared_mutex                              m_RoomMutex;
        std::unordered_map<std::string, std::shared_ptr<Room>> m_Rooms;
    };

} // namespace PeerBeam
