#include "core/Errors.h"
#include "negotiation/EventQueue.h"
#include "shared/Encoding.h"
#include "shared/Protocol.h"
#include "shared/SignalMessage.h"
#include "transport/PeerTransport.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

using namespace PeerBeam;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// SignalMessage
// ---------------------------------------------------------------------------

TEST(SignalMessageTest, ParsesKnownFields) {
    SignalMessage msg = SignalMessage::Parse(
        R"({"type":"offer","room_id":"r1","file_id":"abc","sdp":"QUJD"})");
    EXPECT_EQ(msg.type, SignalType::Offer);
    EXPECT_EQ(msg.roomId, "r1");
    EXPECT_EQ(msg.fileId, "abc");
    EXPECT_EQ(msg.sdp, "QUJD");
    EXPECT_TRUE(msg.error.empty());
}

TEST(SignalMessageTest, SerializeOmitsEmptyFields) {
    json j = json::parse(SignalMessage::Make(SignalType::CreateRoom, "r1").Serialize());
    EXPECT_EQ(j["type"], "create_room");
    EXPECT_EQ(j["room_id"], "r1");
    EXPECT_FALSE(j.contains("sdp"));
    EXPECT_FALSE(j.contains("file_id"));
    EXPECT_FALSE(j.contains("error"));
}

TEST(SignalMessageTest, UnknownTypeKeepsRawName) {
    SignalMessage msg = SignalMessage::Parse(R"({"type":"dance"})");
    EXPECT_EQ(msg.type, SignalType::Unknown);
    EXPECT_EQ(msg.rawType, "dance");
    EXPECT_EQ(json::parse(msg.Serialize())["type"], "dance");
}

TEST(SignalMessageTest, RejectsMalformedBodies) {
    for (const char* body : { "not json", "[1,2]", R"({"type":5})", R"({"type":"offer","sdp":{}})" }) {
        try {
            SignalMessage::Parse(body);
            FAIL() << "accepted " << body;
        }
        catch (const ProtocolError& e) {
            EXPECT_EQ(e.Code(), SignalErrorCode::MalformedMessage) << body;
        }
    }
}

TEST(SignalMessageTest, ErrorMessageCarriesText) {
    json j = json::parse(SignalMessage::MakeError("room not found").Serialize());
    EXPECT_EQ(j["type"], "error");
    EXPECT_EQ(j["error"], "room not found");
}

// ---------------------------------------------------------------------------
// Base64 and file ids
// ---------------------------------------------------------------------------

TEST(EncodingTest, Base64KnownVectors) {
    EXPECT_EQ(EncodeBase64(std::string("")), "");
    EXPECT_EQ(EncodeBase64(std::string("f")), "Zg==");
    EXPECT_EQ(EncodeBase64(std::string("fo")), "Zm8=");
    EXPECT_EQ(EncodeBase64(std::string("foobar")), "Zm9vYmFy");

    std::string out;
    ASSERT_TRUE(DecodeBase64("Zm9vYg==", out));
    EXPECT_EQ(out, "foob");
    ASSERT_TRUE(DecodeBase64("Zm9v\nYmFy\r\n", out));
    EXPECT_EQ(out, "foobar");
}

TEST(EncodingTest, Base64RejectsGarbage) {
    std::string out;
    EXPECT_FALSE(DecodeBase64("Zm9v!mFy", out));
    EXPECT_FALSE(DecodeBase64("Zg==Zg", out));
}

TEST(EncodingTest, FileIdsAreSixteenHexDigits) {
    const std::string a = GenerateFileId();
    const std::string b = GenerateFileId();
    EXPECT_EQ(a.size(), 16u);
    EXPECT_TRUE(IsFileId(a));
    EXPECT_NE(a, b);
    EXPECT_FALSE(IsFileId("0123456789abcdeg"));
    EXPECT_FALSE(IsFileId("abc"));
}

// ---------------------------------------------------------------------------
// Session description blobs
// ---------------------------------------------------------------------------

TEST(SessionDescriptionTest, BlobIsBase64OfTypeAndSdp) {
    SessionDescription desc{ "offer", "v=0\r\ns=-\r\n" };
    const std::string blob = EncodeSessionDescription(desc);

    std::string decoded;
    ASSERT_TRUE(DecodeBase64(blob, decoded));
    json j = json::parse(decoded);
    EXPECT_EQ(j["type"], "offer");
    EXPECT_EQ(j["sdp"], desc.sdp);

    SessionDescription back = DecodeSessionDescription(blob);
    EXPECT_EQ(back.type, "offer");
    EXPECT_EQ(back.sdp, desc.sdp);
}

TEST(SessionDescriptionTest, RejectsBadBlobs) {
    EXPECT_THROW(DecodeSessionDescription("%%%"), ProtocolError);
    EXPECT_THROW(DecodeSessionDescription(EncodeBase64(std::string("not json"))), ProtocolError);
    EXPECT_THROW(DecodeSessionDescription(EncodeBase64(std::string(R"({"type":"pranswer","sdp":"x"})"))),
        ProtocolError);
}

// ---------------------------------------------------------------------------
// Framing
// ---------------------------------------------------------------------------

TEST(FramingTest, HeaderIsTypeThenBigEndianSize) {
    const std::vector<uint8_t> frame = EncodeFrame(FrameType::Signal, "{}");
    ASSERT_EQ(frame.size(), sizeof(FrameHeader) + 2);
    EXPECT_EQ(frame[0], static_cast<uint8_t>(FrameType::Signal));
    EXPECT_EQ(ReadU32BE(frame.data() + 1), 2u);
    EXPECT_EQ(frame[5], '{');
}

// ---------------------------------------------------------------------------
// EventQueue
// ---------------------------------------------------------------------------

TEST(EventQueueTest, WaitForSkipsOtherKinds) {
    EventQueue q;
    q.Push(EventKind::ChannelMessage, "data");
    q.Push(EventKind::PeerJoined);

    NegotiationEvent ev;
    ASSERT_EQ(q.WaitFor({ EventKind::PeerJoined }, EventQueue::Clock::now(), ev), WaitStatus::Ready);
    EXPECT_EQ(ev.kind, EventKind::PeerJoined);
    EXPECT_EQ(q.Pending(), 1u);
}

TEST(EventQueueTest, TimesOutWhenNothingMatches) {
    EventQueue q;
    NegotiationEvent ev;
    const auto start = EventQueue::Clock::now();
    EXPECT_EQ(q.WaitFor({ EventKind::PeerJoined }, start + std::chrono::milliseconds(50), ev),
        WaitStatus::TimedOut);
    EXPECT_GE(EventQueue::Clock::now() - start, std::chrono::milliseconds(45));
}

TEST(EventQueueTest, LostLinkEndsWaitButQueuedDataWins) {
    EventQueue q;
    q.Push(EventKind::ChannelMessage, "last words");
    q.SetLinkState(LinkState::Failed);

    NegotiationEvent ev;
    const auto deadline = EventQueue::Clock::now() + std::chrono::seconds(5);
    EXPECT_EQ(q.WaitFor({ EventKind::ChannelMessage }, deadline, ev), WaitStatus::Ready);
    EXPECT_EQ(q.WaitFor({ EventKind::ChannelMessage }, deadline, ev), WaitStatus::LinkLost);
}

TEST(EventQueueTest, TerminalLinkStateSticks) {
    EventQueue q;
    q.SetLinkState(LinkState::Failed);
    q.SetLinkState(LinkState::Connected);
    EXPECT_EQ(q.GetLinkState(), LinkState::Failed);
}

TEST(EventQueueTest, WaitForConnectedWakesOnStateChange) {
    EventQueue q;
    std::thread t([&q] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.SetLinkState(LinkState::Connected);
    });
    EXPECT_EQ(q.WaitForConnected(EventQueue::Clock::now() + std::chrono::seconds(5)), WaitStatus::Ready);
    t.join();
}

TEST(EventQueueTest, BriefConnectionStillCountsAsConnected) {
    EventQueue q;
    q.SetLinkState(LinkState::Connected);
    q.Push(EventKind::ChannelOpen);
    q.SetLinkState(LinkState::Closed);

    EXPECT_EQ(q.WaitForConnected(EventQueue::Clock::now()), WaitStatus::Ready);
    NegotiationEvent ev;
    EXPECT_EQ(q.WaitFor({ EventKind::ChannelOpen }, EventQueue::Clock::now(), ev), WaitStatus::Ready);
}

TEST(EventQueueTest, NeverConnectedLinkIsLost) {
    EventQueue q;
    q.SetLinkState(LinkState::Connecting);
    q.SetLinkState(LinkState::Failed);
    EXPECT_EQ(q.WaitForConnected(EventQueue::Clock::now() + std::chrono::seconds(5)), WaitStatus::LinkLost);
}
