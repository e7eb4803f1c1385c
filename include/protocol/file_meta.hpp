#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace protocol {

// Keys are part of the wire format: {"filename": ..., "filesize": ...}
struct FileInfo {
    std::string filename;
    uint64_t filesize;
};

// Map JSON parsing automatically using nlohmann
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileInfo, filename, filesize)

std::string serialize_file_info(const FileInfo& info);

// Throws ProtocolError on malformed json, missing keys or a negative size
FileInfo parse_file_info(const std::string& payload);

} // namespace protocol
