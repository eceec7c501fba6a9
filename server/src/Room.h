#pragma once
#include "RoomMember.h"
#include <chrono>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>

namespace PeerBeam {

    class Room {
    public:
        explicit Room(std::string id);

        const std::string& Id() const { return m_Id; }
        std::chrono::system_clock::time_point CreatedAt() const { return m_CreatedAt; }

        void Add(const std::shared_ptr<RoomMember>& member);
        // Returns the number of members left.
        size_t Remove(const std::shared_ptr<RoomMember>& member);
        size_t Size() const;
        bool Contains(const std::shared_ptr<RoomMember>& member) const;

        // Delivers to every member except `exclude` (may be null).
        void Broadcast(const SignalMessage& msg, const RoomMember* exclude) const;

    private:
        const std::string                         m_Id;
        const std::chrono::system_clock::time_point m_CreatedAt;

        mutable std::shared_mutex                 m_MemberMutex;
        std::set<std::shared_ptr<RoomMember>>     m_Members;
    };

} // namespace PeerBeam
