#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace PeerBeam {

    // Standard alphabet with '=' padding.
    std::string EncodeBase64(const uint8_t* data, size_t len);
    std::string EncodeBase64(const std::string& data);
    // Whitespace is skipped; any other character outside the alphabet fails.
    bool DecodeBase64(const std::string& encoded, std::string& out);

    // 8 random bytes as 16 lowercase hex digits.
    std::string GenerateFileId();
    bool IsFileId(const std::string& candidate);

} // namespace PeerBeam
