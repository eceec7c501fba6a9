#pragma once
#include "DescriptionExchange.h"
#include <chrono>
#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace PeerBeam {

    // A human carries the base64 descriptions between the two terminals.
    // The pasted line is read on a thread of its own and arrives as an event,
    // so the negotiator's timeouts and link checks apply as with a broker.
    class ManualExchange : public DescriptionExchange {
    public:
        // `presetRemote` is a description already supplied on the command line.
        ManualExchange(std::istream& in, std::ostream& out, std::string presetRemote = {},
            std::string presetFileId = {});
        ~ManualExchange() override;

        void Start(EventQueue& events) override;
        bool UsesRoom() const override { return false; }
        void CreateRoom(const std::string&) override {}
        void JoinRoom(const std::string&) override {}
        void PublishOffer(const std::string& roomId, const std::string& fileId,
            const std::string& blob) override;
        void PublishAnswer(const std::string& roomId, const std::string& blob) override;
        void RequestRemoteDescription() override;
        // Stops delivery from the reader. A reader still blocked on input is
        // left to finish on its own.
        void Close() override;

    private:
        struct ReaderState {
            std::mutex              mutex;
            std::condition_variable cv;
            EventQueue*             events = nullptr;
            bool                    done = false;
        };

        static void ReadDescription(std::istream& in, std::shared_ptr<ReaderState> state);

        static constexpr std::chrono::milliseconds kReaderGrace{ 200 };

        std::istream&                m_In;
        std::ostream&                m_Out;
        std::string                  m_PresetRemote;
        std::string                  m_PresetFileId;
        EventQueue*                  m_Events = nullptr;
        bool                         m_OfferPublished = false;
        std::shared_ptr<ReaderState> m_Reader = std::make_shared<ReaderState>();
        std::thread                  m_ReaderThread;
    };

} // namespace PeerBeam
