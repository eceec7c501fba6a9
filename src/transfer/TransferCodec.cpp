#include "TransferCodec.h"
#include "../core/Errors.h"
#include "../core/Logger.h"
#include "../shared/Protocol.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdio>
#include <istream>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace {
    constexpr double kBytesPerMB = 1024.0 * 1024.0;
}

namespace PeerBeam {

    std::string EncodeMetadata(const FileMetadata& meta) {
        json j;
        j["fileName"] = meta.fileName;
        j["fileSize"] = meta.fileSize;
        return j.dump();
    }

    FileMetadata DecodeMetadata(const uint8_t* data, size_t len) {
        FileMetadata meta;
        try {
            json j = json::parse(data, data + len);
            meta.fileName = j.at("fileName").get<std::string>();
            meta.fileSize = j.at("fileSize").get<int64_t>();
        }
        catch (const json::exception& e) {
            throw TransferError(TransferError::Kind::Decode,
                std::string("invalid file metadata: ") + e.what());
        }
        if (meta.fileSize < 0)
            throw TransferError(TransferError::Kind::Decode, "invalid file metadata: negative fileSize");
        return meta;
    }

    std::vector<uint8_t> EncodeLengthPrefix(uint32_t length) {
        std::vector<uint8_t> out;
        out.reserve(4);
        AppendBE(out, length);
        return out;
    }

    std::string AckMessage() {
        return json{ { "type", "file_received" } }.dump();
    }

    bool IsAckMessage(const std::vector<uint8_t>& payload) {
        if (payload.empty() || payload.front() != '{') return false;
        json j = json::parse(payload.begin(), payload.end(), nullptr, false);
        return j.is_object() && j.value("type", "") == "file_received";
    }

    TransferProgress MakeProgress(int64_t bytes, int64_t total, std::chrono::steady_clock::time_point start) {
        TransferProgress p;
        p.bytes = bytes;
        p.total = total;
        if (total > 0) p.percent = 100.0 * static_cast<double>(bytes) / static_cast<double>(total);
        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (seconds > 0.0) p.mbps = static_cast<double>(bytes) / kBytesPerMB / seconds;
        return p;
    }

    // ---------------------------------------------------------------------------
    // TransferSender
    // ---------------------------------------------------------------------------

    TransferSender::TransferSender(DataChannel& channel, size_t chunkSize)
        : m_Channel(channel), m_ChunkSize(chunkSize) {
        if (m_ChunkSize == 0 || m_ChunkSize > 64 * 1024)
            throw std::invalid_argument("chunk size must be between 1 and 65536");
    }

    void TransferSender::SendOrThrow(const uint8_t* data, size_t len, const char* what) {
        if (std::chrono::steady_clock::now() > m_Deadline)
            throw TransferError(TransferError::Kind::Timeout, "transfer exceeded its time limit");
        if (!m_Channel.Send(data, len))
            throw TransferError(TransferError::Kind::ChannelClosed, std::string("failed to send ") + what);
    }

    int64_t TransferSender::Send(std::istream& source, const FileMetadata& meta) {
        const std::string body = EncodeMetadata(meta);
        const std::vector<uint8_t> prefix = EncodeLengthPrefix(static_cast<uint32_t>(body.size()));
        SendOrThrow(prefix.data(), prefix.size(), "metadata length");
        SendOrThrow(reinterpret_cast<const uint8_t*>(body.data()), body.size(), "metadata");
        LOG_TRANSFER("sending " + meta.fileName + " (" + std::to_string(meta.fileSize) + " bytes)");

        const auto start = std::chrono::steady_clock::now();
        std::vector<uint8_t> chunk(m_ChunkSize);
        int64_t sent = 0;
        while (source) {
            source.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
            const std::streamsize n = source.gcount();
            if (n <= 0) break;
            SendOrThrow(chunk.data(), static_cast<size_t>(n), "file chunk");
            sent += n;
            if (m_Progress) m_Progress(MakeProgress(sent, meta.fileSize, start));
        }
        if (source.bad())
            throw TransferError(TransferError::Kind::Io, "read error on " + meta.fileName);
        if (meta.fileSize > 0 && sent != meta.fileSize)
            throw TransferError(TransferError::Kind::Io, meta.fileName + " changed size while sending: "
                + std::to_string(sent) + " of " + std::to_string(meta.fileSize) + " bytes");
        return sent;
    }

    int64_t TransferSender::SendFile(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw TransferError(TransferError::Kind::Io, "not a regular file: " + path.string());
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) throw TransferError(TransferError::Kind::Io, "cannot stat " + path.string() + ": " + ec.message());

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) throw TransferError(TransferError::Kind::Io, "cannot open " + path.string());

        FileMetadata meta;
        meta.fileName = path.filename().string();
        meta.fileSize = static_cast<int64_t>(size);
        return Send(file, meta);
    }

    // ---------------------------------------------------------------------------
    // FileSink
    // ---------------------------------------------------------------------------

    FileSink::FileSink(std::filesystem::path path) : m_Path(std::move(path)) {
        m_File.open(m_Path, std::ios::binary | std::ios::trunc);
        if (!m_File.is_open())
            throw TransferError(TransferError::Kind::Io, "cannot create " + m_Path.string());
    }

    FileSink::~FileSink() {
        if (!m_Done) Abort();
    }

    void FileSink::Write(const uint8_t* data, size_t len) {
        m_File.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!m_File) throw TransferError(TransferError::Kind::Io, "write to " + m_Path.string() + " failed");
    }

    void FileSink::Finalize() {
        m_File.flush();
        const bool ok = static_cast<bool>(m_File);
        m_File.close();
        m_Done = true;
        if (!ok) throw TransferError(TransferError::Kind::Io, "flushing " + m_Path.string() + " failed");
    }

    void FileSink::Abort() {
        if (m_File.is_open()) m_File.close();
        m_Done = true;
        // Never leave a truncated file behind.
        std::error_code ec;
        std::filesystem::remove(m_Path, ec);
    }

    // ---------------------------------------------------------------------------
    // TransferReceiver
    // ---------------------------------------------------------------------------

    const char* ReceiveStateName(ReceiveState state) {
        switch (state) {
        case ReceiveState::AwaitingLengthPrefix: return "awaiting-length-prefix";
        case ReceiveState::AwaitingMetadataBody: return "awaiting-metadata-body";
        case ReceiveState::ReceivingPayload:     return "receiving-payload";
        case ReceiveState::Complete:             return "complete";
        }
        return "?";
    }

    TransferReceiver::TransferReceiver(SinkFactory factory, DataChannel* ackChannel)
        : m_Factory(std::move(factory)), m_AckChannel(ackChannel) {
    }

    TransferReceiver::~TransferReceiver() {
        if (m_State != ReceiveState::Complete) AbortSink();
    }

    void TransferReceiver::Feed(const uint8_t* data, size_t len) {
        try {
            size_t cursor = 0;
            while (cursor < len) {
                switch (m_State) {
                case ReceiveState::AwaitingLengthPrefix:
                    cursor += ConsumePrefix(data + cursor, len - cursor);
                    break;
                case ReceiveState::AwaitingMetadataBody:
                    cursor += ConsumeMetadata(data + cursor, len - cursor);
                    break;
                case ReceiveState::ReceivingPayload:
                    cursor += ConsumePayload(data + cursor, len - cursor);
                    break;
                case ReceiveState::Complete:
                    if (!m_WarnedSurplus) {
                        LOG_WARN("ignoring " + std::to_string(len - cursor) + " bytes past the declared file size");
                        m_WarnedSurplus = true;
                    }
                    return;
                }
            }
        }
        catch (const TransferError&) {
            AbortSink();
            throw;
        }
    }

    size_t TransferReceiver::ConsumePrefix(const uint8_t* data, size_t len) {
        const size_t take = std::min(len, size_t{ 4 } - m_Prefix.size());
        m_Prefix.insert(m_Prefix.end(), data, data + take);
        if (m_Prefix.size() == 4) {
            m_MetadataLength = ReadU32BE(m_Prefix.data());
            if (m_MetadataLength == 0 || m_MetadataLength > kMaxMetadataSize)
                throw TransferError(TransferError::Kind::Decode,
                    "invalid metadata length " + std::to_string(m_MetadataLength));
            m_MetadataBody.reserve(m_MetadataLength);
            m_State = ReceiveState::AwaitingMetadataBody;
        }
        return take;
    }

    size_t TransferReceiver::ConsumeMetadata(const uint8_t* data, size_t len) {
        const size_t take = std::min(len, static_cast<size_t>(m_MetadataLength) - m_MetadataBody.size());
        m_MetadataBody.insert(m_MetadataBody.end(), data, data + take);
        if (m_MetadataBody.size() < m_MetadataLength) return take;

        m_Meta = DecodeMetadata(m_MetadataBody.data(), m_MetadataBody.size());
        // Only the final path component is trusted.
        m_Meta.fileName = std::filesystem::path(m_Meta.fileName).filename().string();
        if (m_Meta.fileName.empty() || m_Meta.fileName == "." || m_Meta.fileName == "..")
            m_Meta.fileName = "received.bin";

        LOG_TRANSFER("incoming " + m_Meta.fileName + " (" + std::to_string(m_Meta.fileSize) + " bytes)");
        m_Sink = m_Factory(m_Meta);
        if (!m_Sink) throw TransferError(TransferError::Kind::Io, "no destination for " + m_Meta.fileName);
        m_Start = std::chrono::steady_clock::now();
        m_State = ReceiveState::ReceivingPayload;
        return take;
    }

    size_t TransferReceiver::ConsumePayload(const uint8_t* data, size_t len) {
        if (!m_Sink)
            throw TransferError(TransferError::Kind::ProtocolViolation, "payload before destination is open");

        size_t take = len;
        if (m_Meta.fileSize > 0)
            take = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(len), m_Meta.fileSize - m_Received));
        m_Sink->Write(data, take);
        m_Received += static_cast<int64_t>(take);
        if (m_Progress) m_Progress(MakeProgress(m_Received, m_Meta.fileSize, m_Start));

        if (m_Meta.fileSize > 0 && m_Received == m_Meta.fileSize) Complete();
        return take;
    }

    void TransferReceiver::Finish() {
        if (m_State == ReceiveState::Complete) return;
        if (m_State == ReceiveState::ReceivingPayload && m_Meta.fileSize == 0) {
            m_AckChannel = nullptr; // nobody left to acknowledge
            Complete();
            return;
        }
        AbortSink();
        throw TransferError(TransferError::Kind::ChannelClosed,
            "channel closed while " + std::string(ReceiveStateName(m_State)) + " after "
            + std::to_string(m_Received) + " bytes");
    }

    void TransferReceiver::Complete() {
        m_End = std::chrono::steady_clock::now();
        m_Sink->Finalize();
        m_Sink.reset();
        m_State = ReceiveState::Complete;

        char buf[128];
        std::snprintf(buf, sizeof(buf), "received %lld bytes in %.2fs (%.2f MB/s)",
            static_cast<long long>(m_Received), ElapsedSeconds(), ThroughputMBps());
        LOG_TRANSFER(buf);

        if (m_AckChannel && !m_AckChannel->Send(AckMessage()))
            LOG_WARN("could not send completion acknowledgement");
    }

    void TransferReceiver::AbortSink() {
        if (m_Sink) {
            m_Sink->Abort();
            m_Sink.reset();
        }
    }

    double TransferReceiver::ElapsedSeconds() const {
        if (m_State == ReceiveState::AwaitingLengthPrefix || m_State == ReceiveState::AwaitingMetadataBody)
            return 0.0;
        const auto end = m_State == ReceiveState::Complete ? m_End : std::chrono::steady_clock::now();
        return std::chrono::duration<double>(end - m_Start).count();
    }

    double TransferReceiver::ThroughputMBps() const {
        const double seconds = ElapsedSeconds();
        return seconds > 0.0 ? static_cast<double>(m_Received) / kBytesPerMB / seconds : 0.0;
    }

} // namespace PeerBeam
