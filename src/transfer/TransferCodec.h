#pragma once
#include "../transport/PeerTransport.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace PeerBeam {

    // Wire format on the data channel:
    //   [u32 BE length][JSON {"fileName","fileSize"}][payload chunks...]
    // followed by {"type":"file_received"} from receiver to sender.
    constexpr size_t kDefaultChunkSize = 32 * 1024;
    constexpr size_t kMaxMetadataSize = 64 * 1024;

    struct FileMetadata {
        std::string fileName;  // display name only
        int64_t     fileSize = 0; // 0: unknown, payload runs until the channel closes
    };

    std::string EncodeMetadata(const FileMetadata& meta);
    // Throws TransferError(Decode).
    FileMetadata DecodeMetadata(const uint8_t* data, size_t len);
    std::vector<uint8_t> EncodeLengthPrefix(uint32_t length);

    std::string AckMessage();
    bool IsAckMessage(const std::vector<uint8_t>& payload);

    struct TransferProgress {
        int64_t bytes = 0;
        int64_t total = 0;
        double  percent = 0.0; // 0 when the total is unknown
        double  mbps = 0.0;
    };
    using ProgressCallback = std::function<void(const TransferProgress&)>;

    TransferProgress MakeProgress(int64_t bytes, int64_t total, std::chrono::steady_clock::time_point start);

    // ---------------------------------------------------------------------------
    // Sender side
    // ---------------------------------------------------------------------------
    class TransferSender {
    public:
        TransferSender(DataChannel& channel, size_t chunkSize = kDefaultChunkSize);

        void SetProgressCallback(ProgressCallback cb) { m_Progress = std::move(cb); }
        void SetDeadline(std::chrono::steady_clock::time_point deadline) { m_Deadline = deadline; }

        // Returns the payload byte count. Throws TransferError.
        int64_t Send(std::istream& source, const FileMetadata& meta);
        int64_t SendFile(const std::filesystem::path& path);

    private:
        void SendOrThrow(const uint8_t* data, size_t len, const char* what);

        DataChannel&                          m_Channel;
        size_t                                m_ChunkSize;
        ProgressCallback                      m_Progress;
        std::chrono::steady_clock::time_point m_Deadline = std::chrono::steady_clock::time_point::max();
    };

    // ---------------------------------------------------------------------------
    // Receiver side
    // ---------------------------------------------------------------------------
    class PayloadSink {
    public:
        virtual ~PayloadSink() = default;
        virtual void Write(const uint8_t* data, size_t len) = 0;
        virtual void Finalize() = 0;
        // Drops whatever was written.
        virtual void Abort() = 0;
    };

    class FileSink : public PayloadSink {
    public:
        explicit FileSink(std::filesystem::path path);
        ~FileSink() override;

        void Write(const uint8_t* data, size_t len) override;
        void Finalize() override;
        void Abort() override;

        const std::filesystem::path& Path() const { return m_Path; }

    private:
        std::filesystem::path m_Path;
        std::ofstream         m_File;
        bool                  m_Done = false;
    };

    enum class ReceiveState { AwaitingLengthPrefix, AwaitingMetadataBody, ReceivingPayload, Complete };

    const char* ReceiveStateName(ReceiveState state);

    // Incremental parser. Any split of the byte stream into messages yields
    // the same result; one message may complete several states.
    class TransferReceiver {
    public:
        using SinkFactory = std::function<std::unique_ptr<PayloadSink>(const FileMetadata&)>;

        // `ackChannel` receives the completion acknowledgement; may be null.
        explicit TransferReceiver(SinkFactory factory, DataChannel* ackChannel = nullptr);
        ~TransferReceiver();

        TransferReceiver(const TransferReceiver&) = delete;
        TransferReceiver& operator=(const TransferReceiver&) = delete;

        void SetProgressCallback(ProgressCallback cb) { m_Progress = std::move(cb); }

        // Throws TransferError; the destination is discarded on failure.
        void Feed(const uint8_t* data, size_t len);
        void Feed(const std::vector<uint8_t>& message) { Feed(message.data(), message.size()); }

        // The channel closed. Completes a size-0 (streaming) transfer,
        // otherwise throws TransferError(ChannelClosed) unless already complete.
        void Finish();

        ReceiveState State() const { return m_State; }
        bool IsComplete() const { return m_State == ReceiveState::Complete; }
        const FileMetadata& Metadata() const { return m_Meta; }
        int64_t BytesReceived() const { return m_Received; }
        double ElapsedSeconds() const;
        double ThroughputMBps() const;

    private:
        size_t ConsumePrefix(const uint8_t* data, size_t len);
        size_t ConsumeMetadata(const uint8_t* data, size_t len);
        size_t ConsumePayload(const uint8_t* data, size_t len);
        void Complete();
        void AbortSink();

        SinkFactory                  m_Factory;
        DataChannel*                 m_AckChannel;
        ProgressCallback             m_Progress;

        ReceiveState                 m_State = ReceiveState::AwaitingLengthPrefix;
        std::vector<uint8_t>         m_Prefix;
        uint32_t                     m_MetadataLength = 0;
        std::vector<uint8_t>         m_MetadataBody;
        FileMetadata                 m_Meta;
        std::unique_ptr<PayloadSink> m_Sink;
        int64_t                      m_Received = 0;
        bool                         m_WarnedSurplus = false;

        std::chrono::steady_clock::time_point m_Start;
        std::chrono::steady_clock::time_point m_End;
    };

} // namespace PeerBeam
