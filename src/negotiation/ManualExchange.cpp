#include "ManualExchange.h"
#include "../core/Logger.h"
#include <functional>
#include <istream>
#include <ostream>

namespace PeerBeam {

    ManualExchange::ManualExchange(std::istream& in, std::ostream& out, std::string presetRemote,
        std::string presetFileId)
        : m_In(in), m_Out(out)
        , m_PresetRemote(std::move(presetRemote))
        , m_PresetFileId(std::move(presetFileId)) {
    }

    ManualExchange::~ManualExchange() {
        Close();
    }

    void ManualExchange::Start(EventQueue& events) {
        m_Events = &events;
        std::lock_guard<std::mutex> lock(m_Reader->mutex);
        m_Reader->events = &events;
    }

    void ManualExchange::PublishOffer(const std::string&, const std::string& fileId,
        const std::string& blob) {
        m_OfferPublished = true;
        m_Out << "\nFile ID: " << fileId << "\n"
              << "Give the receiver this offer:\n" << fileId << "|" << blob << "\n\n";
        m_Out.flush();
    }

    void ManualExchange::PublishAnswer(const std::string&, const std::string& blob) {
        m_Out << "\nGive the sender this answer:\n" << blob << "\n\n";
        m_Out.flush();
    }

    void ManualExchange::RequestRemoteDescription() {
        if (!m_Events) return;

        if (!m_PresetRemote.empty()) {
            NegotiationEvent ev;
            ev.kind = EventKind::RemoteDescription;
            ev.text = std::move(m_PresetRemote);
            ev.fileId = m_PresetFileId;
            m_PresetRemote.clear();
            m_Events->Push(std::move(ev));
            return;
        }
        if (m_ReaderThread.joinable()) return;

        m_Out << (m_OfferPublished ? "Paste the answer from the receiver: "
                                   : "Paste the offer from the sender: ");
        m_Out.flush();
        m_ReaderThread = std::thread(&ManualExchange::ReadDescription, std::ref(m_In), m_Reader);
    }

    void ManualExchange::ReadDescription(std::istream& in, std::shared_ptr<ReaderState> state) {
        std::string line;
        while (std::getline(in, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
            if (!line.empty()) break;
        }

        NegotiationEvent ev;
        if (line.empty()) {
            ev.kind = EventKind::SignalingClosed;
            ev.text = "no description entered";
        }
        else {
            ev.kind = EventKind::RemoteDescription;
            // An offer copied whole from the sender still carries its file id.
            const size_t bar = line.find('|');
            if (bar != std::string::npos) {
                ev.fileId = line.substr(0, bar);
                ev.text = line.substr(bar + 1);
            }
            else {
                ev.text = line;
            }
        }

        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->events) state->events->Push(std::move(ev));
        state->done = true;
        state->cv.notify_all();
    }

    void ManualExchange::Close() {
        {
            std::lock_guard<std::mutex> lock(m_Reader->mutex);
            m_Reader->events = nullptr;
        }
        if (!m_ReaderThread.joinable()) return;

        bool done;
        {
            std::unique_lock<std::mutex> lock(m_Reader->mutex);
            done = m_Reader->cv.wait_for(lock, kReaderGrace, [this] { return m_Reader->done; });
        }
        if (done) {
            m_ReaderThread.join();
        }
        else {
            // A blocked terminal read cannot be cancelled; the reader owns its
            // state and exits on the next line or end of input.
            LOG_DEBUG("manual exchange reader still waiting for input, detaching");
            m_ReaderThread.detach();
        }
    }

} // namespace PeerBeam
