#include "Encoding.h"
#include <random>
#include <cctype>

namespace {

    constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    constexpr char kHexDigits[] = "0123456789abcdef";
    constexpr size_t kFileIdBytes = 8;

    int Base64CharValue(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }

} // namespace

namespace PeerBeam {

    std::string EncodeBase64(const uint8_t* data, size_t len) {
        std::string encoded;
        encoded.reserve((len + 2) / 3 * 4);
        for (size_t i = 0; i < len; i += 3) {
            uint32_t n = (uint32_t)data[i] << 16
                | (i + 1 < len ? (uint32_t)data[i + 1] << 8 : 0u)
                | (i + 2 < len ? (uint32_t)data[i + 2] : 0u);
            encoded += kBase64Alphabet[(n >> 18) & 63];
            encoded += kBase64Alphabet[(n >> 12) & 63];
            encoded += (i + 1 < len) ? kBase64Alphabet[(n >> 6) & 63] : '=';
            encoded += (i + 2 < len) ? kBase64Alphabet[n & 63] : '=';
        }
        return encoded;
    }

    std::string EncodeBase64(const std::string& data) {
        return EncodeBase64(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    bool DecodeBase64(const std::string& encoded, std::string& out) {
        out.clear();
        out.reserve(encoded.size() * 3 / 4);
        uint32_t buffer = 0;
        int      bits = 0;
        bool     padding = false;
        for (char c : encoded) {
            if (std::isspace(static_cast<unsigned char>(c))) continue;
            if (c == '=') { padding = true; continue; }
            if (padding) return false; // data after padding
            const int v = Base64CharValue(c);
            if (v < 0) return false;
            buffer = (buffer << 6) | static_cast<uint32_t>(v);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
            }
        }
        return true;
    }

    std::string GenerateFileId() {
        std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 255);

        std::string id;
        id.reserve(kFileIdBytes * 2);
        for (size_t i = 0; i < kFileIdBytes; ++i) {
            const int b = dist(rng);
            id += kHexDigits[(b >> 4) & 0x0F];
            id += kHexDigits[b & 0x0F];
        }
        return id;
    }

    bool IsFileId(const std::string& candidate) {
        if (candidate.size() != kFileIdBytes * 2) return false;
        for (char c : candidate)
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        return true;
    }

} // namespace PeerBeam
