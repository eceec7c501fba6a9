#pragma once
#include <cstdint>
#include <cstring>
#include <vector>
#include <string>

namespace PeerBeam {

    // ---------------------------------------------------------------------------
    // Endianness helpers shared by the signaling framing and the transfer codec.
    // ---------------------------------------------------------------------------
    namespace detail {
        inline bool IsLittleEndian() noexcept {
            static constexpr uint32_t kOne = 1u;
            uint8_t b;
            std::memcpy(&b, &kOne, 1);
            return b == 1u;
        }
    }

    inline uint32_t Swap32(uint32_t v) noexcept {
        return ((v & 0xFFU) << 24) | ((v & 0xFF00U) << 8)
            | ((v & 0xFF0000U) >> 8) | ((v & 0xFF000000U) >> 24);
    }

    inline uint32_t HostToNet32(uint32_t v) noexcept {
        return detail::IsLittleEndian() ? Swap32(v) : v;
    }
    inline uint32_t NetToHost32(uint32_t v) noexcept { return HostToNet32(v); }

    // Append a 4-byte value in big-endian order.
    inline void AppendBE(std::vector<uint8_t>& out, uint32_t value) {
        uint32_t net = HostToNet32(value);
        uint8_t  tmp[4];
        std::memcpy(tmp, &net, 4);
        for (uint8_t b : tmp) out.push_back(b);
    }

    // The shift loop produces the host-order result directly.
    inline uint32_t ReadU32BE(const uint8_t* p) noexcept {
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | static_cast<uint32_t>(p[i]);
        return v;
    }

    constexpr uint16_t SIGNALING_PORT = 37851;
    constexpr const char* DEFAULT_SIGNALING_HOST = "175.24.2.28";

    // Signal bodies carry base64 session descriptions with all candidates
    // inlined; a few KiB is typical, anything near this cap is hostile.
    constexpr uint32_t kMaxFrameSize = 1024 * 1024;

    enum class FrameType : uint8_t {
        Signal, // UTF-8 JSON SignalMessage
        Ping,
        Pong
    };

#pragma pack(push, 1)
    struct FrameHeader {
        FrameType type;
        uint32_t  size;

        void ToNetwork() { size = HostToNet32(size); }
        void ToHost() { size = NetToHost32(size); }
    };
#pragma pack(pop)

    static_assert(sizeof(FrameHeader) == 5, "FrameHeader must be packed");

    // Header + body in one contiguous buffer, ready for a single async_write.
    inline std::vector<uint8_t> EncodeFrame(FrameType type, const std::string& body) {
        FrameHeader h{ type, static_cast<uint32_t>(body.size()) };
        h.ToNetwork();
        std::vector<uint8_t> out(sizeof(FrameHeader) + body.size());
        std::memcpy(out.data(), &h, sizeof(FrameHeader));
        if (!body.empty())
            std::memcpy(out.data() + sizeof(FrameHeader), body.data(), body.size());
        return out;
    }

} // namespace PeerBeam
