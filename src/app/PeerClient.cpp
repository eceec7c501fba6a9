#include "PeerClient.h"
#include "ReceiveAddress.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include "../negotiation/BrokerExchange.h"
#include "../negotiation/ManualExchange.h"
#include "../shared/Encoding.h"
#include "../transport/RtcPeerTransport.h"
#include <algorithm>
#include <system_error>

namespace PeerBeam {

    PeerClient::PeerClient(PeerConfig config, TransportFactory transports, ExchangeFactory exchanges)
        : m_Config(std::move(config))
        , m_Transports(std::move(transports))
        , m_Exchanges(std::move(exchanges)) {
        m_Config.Validate();
    }

    PeerClient::TransportFactory PeerClient::RtcTransports(const PeerConfig& config) {
        return [servers = config.iceServers](EventQueue& events) -> std::unique_ptr<PeerTransport> {
            return std::make_unique<RtcPeerTransport>(servers, events);
        };
    }

    PeerClient::ExchangeFactory PeerClient::BrokerExchanges(const PeerConfig& config) {
        return [host = config.signalingHost, port = config.signalingPort]() -> std::unique_ptr<DescriptionExchange> {
            return std::make_unique<BrokerExchange>(host, port);
        };
    }

    PeerClient::ExchangeFactory PeerClient::ManualExchanges(std::istream& in, std::ostream& out,
        std::string presetOffer, std::string presetFileId) {
        return [&in, &out, presetOffer, presetFileId]() -> std::unique_ptr<DescriptionExchange> {
            return std::make_unique<ManualExchange>(in, out, presetOffer, presetFileId);
        };
    }

    std::string PeerClient::RoomFor(const std::string& fileId) const {
        return m_Config.roomId.empty() ? fileId : m_Config.roomId;
    }

    TransferReport PeerClient::SendFile(const std::filesystem::path& file, std::string fileId) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file, ec))
            throw TransferError(TransferError::Kind::Io, "cannot send " + file.string() + ": not a regular file");
        if (fileId.empty()) fileId = GenerateFileId();

        TransferReport report;
        report.fileId = fileId;
        report.fileName = file.filename().string();
        report.path = file;

        // Destruction order matters: transport and exchange report into `events`.
        EventQueue events;
        std::unique_ptr<PeerTransport> transport = m_Transports(events);
        std::unique_ptr<DescriptionExchange> exchange = m_Exchanges();
        SessionNegotiator negotiator(NegotiationRole::Sender, *transport, *exchange, events, m_Config.timeouts);

        LOG_INFO("sending " + file.string() + " as file id " + fileId);
        std::shared_ptr<DataChannel> channel;
        try {
            channel = negotiator.Run(RoomFor(fileId), fileId);
        }
        catch (const std::exception&) {
            m_LastPhase = negotiator.Phase();
            throw;
        }
        m_LastPhase = negotiator.Phase();
        exchange->Close();

        const auto start = std::chrono::steady_clock::now();
        const auto deadline = start + m_Config.timeouts.transfer;
        try {
            TransferSender sender(*channel, m_Config.chunkSize);
            sender.SetDeadline(deadline);
            if (m_Progress) sender.SetProgressCallback(m_Progress);
            report.bytes = sender.SendFile(file);
            report.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
            if (report.seconds > 0.0)
                report.mbps = static_cast<double>(report.bytes) / (1024.0 * 1024.0) / report.seconds;

            if (report.bytes == 0) {
                // Size 0 is read as "until close" by the receiver.
                LOG_TRANSFER("empty file sent, closing channel");
            }
            else {
                const auto ackDeadline = std::min(deadline,
                    std::chrono::steady_clock::now() + m_Config.timeouts.acknowledgement);
                report.acknowledged = AwaitAcknowledgement(events, ackDeadline);
            }
        }
        catch (const std::exception&) {
            negotiator.MarkFailed();
            m_LastPhase = negotiator.Phase();
            throw;
        }

        negotiator.MarkCompleted();
        m_LastPhase = negotiator.Phase();
        transport->Close();
        return report;
    }

    bool PeerClient::AwaitAcknowledgement(EventQueue& events, std::chrono::steady_clock::time_point deadline) {
        for (;;) {
            NegotiationEvent ev;
            switch (events.WaitFor({ EventKind::ChannelMessage, EventKind::ChannelClosed }, deadline, ev)) {
            case WaitStatus::TimedOut:
                LOG_WARN("no acknowledgement from the receiver; the file was sent but delivery is unconfirmed");
                return false;
            case WaitStatus::LinkLost:
                LOG_WARN("connection lost before the receiver acknowledged the file");
                return false;
            case WaitStatus::Ready:
                break;
            }
            if (ev.kind == EventKind::ChannelClosed) {
                LOG_WARN("channel closed before the receiver acknowledged the file");
                return false;
            }
            if (IsAckMessage(ev.payload)) {
                LOG_TRANSFER("receiver confirmed the file");
                return true;
            }
            LOG_DEBUG("ignoring " + std::to_string(ev.payload.size()) + " byte message while waiting for acknowledgement");
        }
    }

    TransferReport PeerClient::ReceiveFile(const std::string& fileId, const std::string& savePath) {
        TransferReport report;
        report.fileId = fileId;

        EventQueue events;
        std::unique_ptr<PeerTransport> transport = m_Transports(events);
        std::unique_ptr<DescriptionExchange> exchange = m_Exchanges();
        SessionNegotiator negotiator(NegotiationRole::Receiver, *transport, *exchange, events, m_Config.timeouts);

        LOG_INFO("receiving file id " + fileId);
        std::shared_ptr<DataChannel> channel;
        try {
            channel = negotiator.Run(RoomFor(fileId), fileId);
        }
        catch (const std::exception&) {
            m_LastPhase = negotiator.Phase();
            throw;
        }
        m_LastPhase = negotiator.Phase();
        report.fileId = negotiator.FileId();
        exchange->Close();

        const auto deadline = std::chrono::steady_clock::now() + m_Config.timeouts.transfer;
        TransferReceiver receiver([&](const FileMetadata& meta) -> std::unique_ptr<PayloadSink> {
            report.fileName = meta.fileName;
            report.path = ResolveSavePath(savePath, meta.fileName);
            LOG_TRANSFER("saving to " + report.path.string());
            return std::make_unique<FileSink>(report.path);
        }, channel.get());
        if (m_Progress) receiver.SetProgressCallback(m_Progress);

        try {
            while (!receiver.IsComplete()) {
                NegotiationEvent ev;
                const WaitStatus status = events.WaitFor(
                    { EventKind::ChannelMessage, EventKind::ChannelClosed }, deadline, ev);
                if (status == WaitStatus::TimedOut)
                    throw TransferError(TransferError::Kind::Timeout, "transfer did not finish within "
                        + std::to_string(m_Config.timeouts.transfer.count() / 1000) + "s");
                if (status == WaitStatus::LinkLost || ev.kind == EventKind::ChannelClosed) {
                    receiver.Finish();
                    break;
                }
                receiver.Feed(ev.payload);
            }
        }
        catch (const std::exception&) {
            negotiator.MarkFailed();
            m_LastPhase = negotiator.Phase();
            throw;
        }

        report.bytes = receiver.BytesReceived();
        report.seconds = receiver.ElapsedSeconds();
        report.mbps = receiver.ThroughputMBps();
        // Streaming transfers end on close; there is nobody left to acknowledge.
        report.acknowledged = receiver.Metadata().fileSize > 0;

        negotiator.MarkCompleted();
        m_LastPhase = negotiator.Phase();
        transport->Close();
        return report;
    }

} // namespace PeerBeam
