#include "protocol/file_meta.hpp"
#include "protocol/packet.hpp"

namespace protocol {

std::string serialize_file_info(const FileInfo& info) {
    nlohmann::json j = info;
    return j.dump();
}

FileInfo parse_file_info(const std::string& payload) {
    try {
        nlohmann::json j = nlohmann::json::parse(payload);
        if (!j.is_object()) {
            throw ProtocolError("File info is not a json object");
        }
        // get<uint64_t>() would silently wrap a negative size
        if (!j.contains("filesize") || !j["filesize"].is_number_unsigned()) {
            throw ProtocolError("File info has no valid 'filesize'");
        }
        return j.get<FileInfo>();
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(std::string("Failed to parse file info: ") + e.what());
    }
}

} // namespace protocol
