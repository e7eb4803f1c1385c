#pragma once

#include <string>
#include <set>
#include <utility>
#include <filesystem>
#include "protocol/packet.hpp"

namespace naming {

constexpr std::size_t kMaxFilenameSize = 255;

class InvalidFilenameError : public protocol::TransferError {
public:
    using protocol::TransferError::TransferError;
};

// Keep only the last path segment, the characters [A-Za-z0-9._-] and well-formed
// UTF-8 multibyte characters. Throws InvalidFilenameError when nothing usable is
// left, or when only an extension survives.
std::string sanitize(const std::string& raw_name);

// "a.tar.gz" -> {"a.tar", ".gz"}, ".bashrc" -> {".bashrc", ""}
std::pair<std::string, std::string> split_extension(const std::string& name);

// First of name, stem_1.ext, stem_2.ext, ... absent from existing_names.
// The stem is shortened when the counter would push past kMaxFilenameSize.
std::string resolve_collision(const std::string& safe_name, const std::set<std::string>& existing_names);

// Picks a free name for safe_name inside dir and creates the empty file, all
// while holding the lock for that directory. Returns the full path.
std::filesystem::path reserve_path(const std::filesystem::path& dir, const std::string& safe_name);

} // namespace naming
