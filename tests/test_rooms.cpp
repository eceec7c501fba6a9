#include "Room.h"
#include "RoomRegistry.h"
#include "SignalDispatcher.h"
#include "core/Errors.h"
#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace PeerBeam;

namespace {

    // Records everything the broker delivers to it.
    class RecordingMember : public RoomMember {
    public:
        explicit RecordingMember(std::string name) : m_Name(std::move(name)) {}

        void Deliver(const SignalMessage& msg) override {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Inbox.push_back(msg);
        }
        void Close() override { closed = true; }
        std::string Describe() const override { return m_Name; }

        std::vector<SignalMessage> Inbox() const {
            std::lock_guard<std::mutex> lock(m_Mutex);
            return m_Inbox;
        }
        size_t Count(SignalType type) const {
            size_t n = 0;
            for (const auto& m : Inbox()) n += m.type == type ? 1 : 0;
            return n;
        }
        SignalMessage Last() const {
            auto inbox = Inbox();
            return inbox.empty() ? SignalMessage{} : inbox.back();
        }
        void Clear() {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_Inbox.clear();
        }

        bool closed = false;

    private:
        std::string                m_Name;
        mutable std::mutex         m_Mutex;
        std::vector<SignalMessage> m_Inbox;
    };

    SignalMessage Offer(const std::string& fileId, const std::string& sdp) {
        SignalMessage msg = SignalMessage::Make(SignalType::Offer);
        msg.fileId = fileId;
        msg.sdp = sdp;
        return msg;
    }

} // namespace

// ---------------------------------------------------------------------------
// RoomRegistry
// ---------------------------------------------------------------------------

TEST(RoomRegistryTest, DuplicateIdIsRejected) {
    RoomRegistry rooms;
    rooms.CreateRoom("r1");
    try {
        rooms.CreateRoom("r1");
        FAIL() << "duplicate room accepted";
    }
    catch (const ProtocolError& e) {
        EXPECT_EQ(e.Code(), SignalErrorCode::DuplicateRoom);
    }
    EXPECT_EQ(rooms.RoomCount(), 1u);
}

TEST(RoomRegistryTest, EmptyRoomIsRemovedAndIdReusable) {
    RoomRegistry rooms;
    auto a = std::make_shared<RecordingMember>("a");
    auto room = rooms.CreateAndEnter("r1", a);
    EXPECT_FALSE(rooms.Leave(room, a));
    EXPECT_EQ(rooms.RoomCount(), 0u);
    EXPECT_EQ(rooms.GetRoom("r1"), nullptr);

    auto again = rooms.CreateAndEnter("r1", a);
    EXPECT_NE(again, room);
    EXPECT_EQ(rooms.RoomCount(), 1u);
}

TEST(RoomRegistryTest, StaleLeaveDoesNotDropNewerRoom) {
    RoomRegistry rooms;
    auto a = std::make_shared<RecordingMember>("a");
    auto b = std::make_shared<RecordingMember>("b");
    auto old = rooms.CreateAndEnter("r1", a);
    EXPECT_FALSE(rooms.Leave(old, a));
    auto fresh = rooms.CreateAndEnter("r1", b);

    EXPECT_FALSE(rooms.Leave(old, a));
    EXPECT_EQ(rooms.GetRoom("r1"), fresh);
}

TEST(RoomRegistryTest, EnterNeverCreates) {
    RoomRegistry rooms;
    auto a = std::make_shared<RecordingMember>("a");
    EXPECT_EQ(rooms.Enter("ghost", a), nullptr);
    EXPECT_EQ(rooms.RoomCount(), 0u);
}

// ---------------------------------------------------------------------------
// SignalDispatcher
// ---------------------------------------------------------------------------

class SignalDispatcherTest : public ::testing::Test {
protected:
    SignalDispatcherTest() : m_Dispatcher(m_Rooms) {}

    void CreateAndJoin(const std::string& roomId) {
        m_Dispatcher.Dispatch(m_Sender, SignalMessage::Make(SignalType::CreateRoom, roomId));
        m_Dispatcher.Dispatch(m_Receiver, SignalMessage::Make(SignalType::JoinRoom, roomId));
    }

    RoomRegistry     m_Rooms;
    SignalDispatcher m_Dispatcher;
    std::shared_ptr<RecordingMember> m_Sender = std::make_shared<RecordingMember>("sender");
    std::shared_ptr<RecordingMember> m_Receiver = std::make_shared<RecordingMember>("receiver");
};

TEST_F(SignalDispatcherTest, CreateThenJoinNotifiesSenderOnce) {
    CreateAndJoin("r1");

    ASSERT_EQ(m_Sender->Inbox().size(), 2u);
    EXPECT_EQ(m_Sender->Inbox()[0].type, SignalType::RoomCreated);
    EXPECT_EQ(m_Sender->Inbox()[0].clientType, "sender");
    EXPECT_EQ(m_Sender->Count(SignalType::PeerJoined), 1u);

    ASSERT_EQ(m_Receiver->Inbox().size(), 1u);
    EXPECT_EQ(m_Receiver->Last().type, SignalType::RoomJoined);
    EXPECT_EQ(m_Receiver->Last().clientType, "receiver");
    EXPECT_EQ(m_Receiver->Count(SignalType::PeerJoined), 0u);

    EXPECT_EQ(m_Rooms.RoomCount(), 1u);
    EXPECT_EQ(m_Sender->Role(), ClientRole::Sender);
    EXPECT_EQ(m_Receiver->Role(), ClientRole::Receiver);
}

TEST_F(SignalDispatcherTest, OfferReachesOnlyTheOtherMember) {
    CreateAndJoin("r1");
    m_Sender->Clear();
    m_Receiver->Clear();

    m_Dispatcher.Dispatch(m_Sender, Offer("f1", "QUJD"));

    EXPECT_TRUE(m_Sender->Inbox().empty());
    ASSERT_EQ(m_Receiver->Inbox().size(), 1u);
    const SignalMessage got = m_Receiver->Last();
    EXPECT_EQ(got.type, SignalType::Offer);
    EXPECT_EQ(got.fileId, "f1");
    EXPECT_EQ(got.sdp, "QUJD");
    EXPECT_EQ(got.roomId, "r1");
}

TEST_F(SignalDispatcherTest, AnswerReachesOnlyTheSender) {
    CreateAndJoin("r1");
    m_Sender->Clear();
    m_Receiver->Clear();

    SignalMessage answer = SignalMessage::Make(SignalType::Answer);
    answer.sdp = "WFla";
    m_Dispatcher.Dispatch(m_Receiver, answer);

    EXPECT_TRUE(m_Receiver->Inbox().empty());
    ASSERT_EQ(m_Sender->Inbox().size(), 1u);
    EXPECT_EQ(m_Sender->Last().type, SignalType::Answer);
    EXPECT_EQ(m_Sender->Last().sdp, "WFla");
}

TEST_F(SignalDispatcherTest, RolesAreEnforced) {
    CreateAndJoin("r1");
    m_Sender->Clear();
    m_Receiver->Clear();

    m_Dispatcher.Dispatch(m_Receiver, Offer("f1", "QUJD"));
    EXPECT_EQ(m_Receiver->Last().type, SignalType::Error);
    EXPECT_EQ(m_Receiver->Last().error, "operation not allowed for this role");
    EXPECT_TRUE(m_Sender->Inbox().empty());

    SignalMessage answer = SignalMessage::Make(SignalType::Answer);
    answer.sdp = "WFla";
    m_Dispatcher.Dispatch(m_Sender, answer);
    EXPECT_EQ(m_Sender->Last().type, SignalType::Error);
    EXPECT_EQ(m_Sender->Last().error, "operation not allowed for this role");
    EXPECT_EQ(m_Receiver->Count(SignalType::Answer), 0u);
}

TEST_F(SignalDispatcherTest, ProtocolErrorsAreRepliedNotFatal) {
    m_Dispatcher.Dispatch(m_Receiver, SignalMessage::Make(SignalType::JoinRoom, "nope"));
    EXPECT_EQ(m_Receiver->Last().type, SignalType::Error);
    EXPECT_EQ(m_Receiver->Last().error, "room not found");

    m_Dispatcher.Dispatch(m_Sender, SignalMessage::Make(SignalType::CreateRoom, ""));
    EXPECT_EQ(m_Sender->Last().error, "room id must not be empty");

    m_Dispatcher.Dispatch(m_Sender, Offer("f1", "QUJD"));
    EXPECT_EQ(m_Sender->Last().error, "not in a room");

    m_Dispatcher.Dispatch(m_Sender, std::string("{broken"));
    EXPECT_EQ(m_Sender->Last().error, "invalid message format");

    m_Dispatcher.Dispatch(m_Sender, std::string(R"({"type":"dance"})"));
    EXPECT_EQ(m_Sender->Last().error, "unknown message type: dance");

    EXPECT_FALSE(m_Sender->closed);
    EXPECT_FALSE(m_Receiver->closed);
    EXPECT_EQ(m_Rooms.RoomCount(), 0u);
}

TEST_F(SignalDispatcherTest, SecondCreateOfSameRoomFails) {
    m_Dispatcher.Dispatch(m_Sender, SignalMessage::Make(SignalType::CreateRoom, "r1"));
    m_Dispatcher.Dispatch(m_Receiver, SignalMessage::Make(SignalType::CreateRoom, "r1"));
    EXPECT_EQ(m_Receiver->Last().type, SignalType::Error);
    EXPECT_EQ(m_Receiver->Last().error, "room already exists");
    EXPECT_EQ(m_Receiver->Role(), ClientRole::None);
}

TEST_F(SignalDispatcherTest, MemberCannotEnterASecondRoom) {
    CreateAndJoin("r1");
    m_Dispatcher.Dispatch(m_Sender, SignalMessage::Make(SignalType::CreateRoom, "r2"));
    EXPECT_EQ(m_Sender->Last().error, "already in a room");
    EXPECT_EQ(m_Rooms.RoomCount(), 1u);
}

TEST_F(SignalDispatcherTest, LeaveNotifiesRemainingMember) {
    CreateAndJoin("r1");
    m_Sender->Clear();

    m_Dispatcher.Leave(m_Receiver);
    EXPECT_EQ(m_Sender->Count(SignalType::PeerLeft), 1u);
    EXPECT_EQ(m_Rooms.RoomCount(), 1u);
    EXPECT_EQ(m_Receiver->CurrentRoom(), nullptr);

    m_Dispatcher.Leave(m_Sender);
    EXPECT_EQ(m_Rooms.RoomCount(), 0u);
}

TEST_F(SignalDispatcherTest, LeaveWithoutRoomIsHarmless) {
    m_Dispatcher.Leave(m_Sender);
    EXPECT_TRUE(m_Sender->Inbox().empty());
    EXPECT_EQ(m_Rooms.RoomCount(), 0u);
}
