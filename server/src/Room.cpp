#include "Room.h"
#include <mutex>
#include <vector>

namespace PeerBeam {

    Room::Room(std::string id)
        : m_Id(std::move(id)), m_CreatedAt(std::chrono::system_clock::now()) {
    }

    void Room::Add(const std::shared_ptr<RoomMember>& member) {
        std::unique_lock lock(m_MemberMutex);
        m_Members.insert(member);
    }

    size_t Room::Remove(const std::shared_ptr<RoomMember>& member) {
        std::unique_lock lock(m_MemberMutex);
        m_Members.erase(member);
        return m_Members.size();
    }

    size_t Room::Size() const {
        std::shared_lock lock(m_MemberMutex);
        return m_Members.size();
    }

    bool Room::Contains(const std::shared_ptr<RoomMember>& member) const {
        std::shared_lock lock(m_MemberMutex);
        return m_Members.count(member) != 0;
    }

    void Room::Broadcast(const SignalMessage& msg, const RoomMember* exclude) const {
        // Snapshot under the shared lock: a member that overflows closes and
        // re-enters Remove(), which needs the exclusive lock.
        std::vector<std::shared_ptr<RoomMember>> targets;
        {
            std::shared_lock lock(m_MemberMutex);
            targets.reserve(m_Members.size());
            for (const auto& member : m_Members)
                if (member.get() != exclude) targets.push_back(member);
        }
        for (const auto& member : targets) member->Deliver(msg);
    }

} // namespace PeerBeam
