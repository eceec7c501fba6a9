#pragma once
#include "../core/Config.h"
#include "../negotiation/DescriptionExchange.h"
#include "../negotiation/EventQueue.h"
#include "../negotiation/SessionNegotiator.h"
#include "../transfer/TransferCodec.h"
#include "../transport/PeerTransport.h"
#include <atomic>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>

namespace PeerBeam {

    struct TransferReport {
        std::string           fileId;
        std::string           fileName;
        std::filesystem::path path;
        int64_t               bytes = 0;
        double                seconds = 0.0;
        double                mbps = 0.0;
        bool                  acknowledged = false;
    };

    // One send or receive attempt: negotiation, then the transfer codec.
    // Transport and exchange are injected so the same flow runs over
    // libdatachannel and the broker, or over test doubles.
    class PeerClient {
    public:
        using TransportFactory = std::function<std::unique_ptr<PeerTransport>(EventQueue&)>;
        using ExchangeFactory = std::function<std::unique_ptr<DescriptionExchange>()>;

        PeerClient(PeerConfig config, TransportFactory transports, ExchangeFactory exchanges);

        static TransportFactory RtcTransports(const PeerConfig& config);
        static ExchangeFactory BrokerExchanges(const PeerConfig& config);
        static ExchangeFactory ManualExchanges(std::istream& in, std::ostream& out,
            std::string presetOffer = {}, std::string presetFileId = {});

        void SetProgressCallback(ProgressCallback cb) { m_Progress = std::move(cb); }

        // An empty fileId gets a random one. Throws NegotiationError,
        // TransportError or TransferError.
        TransferReport SendFile(const std::filesystem::path& file, std::string fileId = {});
        TransferReport ReceiveFile(const std::string& fileId, const std::string& savePath);

        NegotiationPhase LastPhase() const { return m_LastPhase.load(); }

    private:
        bool AwaitAcknowledgement(EventQueue& events, std::chrono::steady_clock::time_point deadline);
        std::string RoomFor(const std::string& fileId) const;

        PeerConfig       m_Config;
        TransportFactory m_Transports;
        ExchangeFactory  m_Exchanges;
        ProgressCallback m_Progress;
        std::atomic<NegotiationPhase> m_LastPhase{ NegotiationPhase::Idle };
    };

} // namespace PeerBeam
