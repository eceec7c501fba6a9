#pragma once
#include <filesystem>
#include <string>

namespace PeerBeam {

    enum class AddressKind { FileId, Http };

    struct ReceiveAddress {
        AddressKind kind = AddressKind::FileId;
        std::string fileId;      // FileId
        std::string manualOffer; // FileId given as "id|offer"
        std::string url;         // Http
    };

    // Decides how `peerbeam receive <input>` reaches the sender:
    //   http:// or https://          -> HTTP
    //   any other scheme://          -> file id (taken verbatim)
    //   16 hex digits                -> file id
    //   contains '/' or '.'          -> HTTP (host[:port]/path)
    //   anything else                -> file id
    // "id|offer" carries a manually exchanged offer and is always a file id.
    ReceiveAddress ClassifyReceiveAddress(const std::string& input);

    // Where an incoming file named `displayName` is written:
    //   "" or "."                    -> ./displayName
    //   existing directory           -> dir/displayName
    //   missing path, no extension   -> created directory/displayName
    //   anything else                -> the path itself (parents created)
    // Throws TransferError(Io) when a directory cannot be created.
    std::filesystem::path ResolveSavePath(const std::string& savePath, const std::string& displayName);

} // namespace PeerBeam
