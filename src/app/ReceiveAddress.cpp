#include "ReceiveAddress.h"
#include "../core/Errors.h"
#include "../shared/Encoding.h"
#include <system_error>

namespace PeerBeam {

    ReceiveAddress ClassifyReceiveAddress(const std::string& input) {
        ReceiveAddress addr;

        if (auto bar = input.find('|'); bar != std::string::npos) {
            addr.fileId = input.substr(0, bar);
            addr.manualOffer = input.substr(bar + 1);
            return addr;
        }

        if (input.rfind("http://", 0) == 0 || input.rfind("https://", 0) == 0) {
            addr.kind = AddressKind::Http;
            addr.url = input;
            return addr;
        }
        if (input.find("://") != std::string::npos || IsFileId(input)) {
            addr.fileId = input;
            return addr;
        }
        if (input.find('/') != std::string::npos || input.find('.') != std::string::npos) {
            addr.kind = AddressKind::Http;
            addr.url = "http://" + input;
            return addr;
        }
        addr.fileId = input;
        return addr;
    }

    std::filesystem::path ResolveSavePath(const std::string& savePath, const std::string& displayName) {
        namespace fs = std::filesystem;
        if (savePath.empty() || savePath == ".") return fs::path(displayName);

        const fs::path target(savePath);
        std::error_code ec;
        if (fs::is_directory(target, ec)) return target / displayName;

        if (!fs::exists(target, ec) && !target.has_extension()) {
            fs::create_directories(target, ec);
            if (ec)
                throw TransferError(TransferError::Kind::Io,
                    "cannot create directory " + target.string() + ": " + ec.message());
            return target / displayName;
        }

        if (target.has_parent_path()) {
            fs::create_directories(target.parent_path(), ec);
            if (ec)
                throw TransferError(TransferError::Kind::Io,
                    "cannot create directory " + target.parent_path().string() + ": " + ec.message());
        }
        return target;
    }

} // namespace PeerBeam
