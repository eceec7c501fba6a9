#include "RoomRegistry.h"
#include "core/Errors.h"
#include <mutex>

namespace PeerBeam {

    std::shared_ptr<Room> RoomRegistry::CreateRoom(const std::string& id) {
        std::unique_lock lock(m_RoomMutex);
        auto [it, inserted] = m_Rooms.try_emplace(id, nullptr);
        if (!inserted)
            throw ProtocolError(SignalErrorCode::DuplicateRoom, "room " + id + " already exists");
        it->second = std::make_shared<Room>(id);
        return it->second;
    }

    std::shared_ptr<Room> RoomRegistry::GetRoom(const std::string& id) const {
        std::shared_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(id);
        return it == m_Rooms.end() ? nullptr : it->second;
    }

    bool RoomRegistry::RemoveRoom(const std::string& id) {
        std::unique_lock lock(m_RoomMutex);
        return m_Rooms.erase(id) != 0;
    }

    std::shared_ptr<Room> RoomRegistry::CreateAndEnter(const std::string& id,
        const std::shared_ptr<RoomMember>& member)
    {
        std::unique_lock lock(m_RoomMutex);
        auto [it, inserted] = m_Rooms.try_emplace(id, nullptr);
        if (!inserted)
            throw ProtocolError(SignalErrorCode::DuplicateRoom, "room " + id + " already exists");
        it->second = std::make_shared<Room>(id);
        it->second->Add(member);
        return it->second;
    }

    std::shared_ptr<Room> RoomRegistry::Enter(const std::string& id,
        const std::shared_ptr<RoomMember>& member)
    {
        std::unique_lock lock(m_RoomMutex);
        auto it = m_Rooms.find(id);
        if (it == m_Rooms.end()) return nullptr;
        it->second->Add(member);
        return it->second;
    }

    bool RoomRegistry::Leave(const std::shared_ptr<Room>& room,
        const std::shared_ptr<RoomMember>& member)
    {
        std::unique_lock lock(m_RoomMutex);
        if (room->Remove(member) > 0) return true;

        // Only drop the entry if it still refers to this room instance.
        auto it = m_Rooms.find(room->Id());
        if (it != m_Rooms.end() && it->second == room) m_Rooms.erase(it);
        return false;
    }

    size_t RoomRegistry::RoomCount() const {
        std::shared_lock lock(m_RoomMutex);
        return m_Rooms.size();
    }

} // namespace PeerBeam
