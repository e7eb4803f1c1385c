#include "filename_policy.hpp"
#include <cerrno>
#include <map>
#include <memory>
#include <mutex>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace naming {

namespace {

bool is_allowed_ascii(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '-' || c == '_';
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed UTF-8 sequence starting at name[i], or 0.
// Overlong forms, surrogates and the C1 control block count as malformed.
std::size_t utf8_sequence_length(const std::string& name, std::size_t i) {
    auto at = [&name](std::size_t k) { return static_cast<unsigned char>(name[k]); };
    unsigned char lead = at(i);

    std::size_t length = 0;
    unsigned char low = 0x80, high = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        if (lead == 0xC2) low = 0xA0;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) low = 0xA0;
        if (lead == 0xED) high = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) low = 0x90;
        if (lead == 0xF4) high = 0x8F;
    } else {
        return 0;
    }

    if (i + length > name.size()) return 0;
    if (at(i + 1) < low || at(i + 1) > high) return 0;
    for (std::size_t k = 2; k < length; ++k) {
        if (!is_continuation(at(i + k))) return 0;
    }
    return length;
}

// Longest prefix of at most max_bytes that does not split a multibyte character
std::string utf8_prefix(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) return text;
    std::size_t cut = max_bytes;
    while (cut > 0 && is_continuation(static_cast<unsigned char>(text[cut]))) {
        --cut;
    }
    return text.substr(0, cut);
}

bool only_dots(const std::string& name) {
    return name.find_first_not_of('.') == std::string::npos;
}

std::string numbered_name(const std::string& stem, const std::string& ext, uint64_t counter) {
    std::string suffix = "_" + std::to_string(counter);
    std::string tail = ext;
    if (suffix.size() + tail.size() >= kMaxFilenameSize) {
        tail = utf8_prefix(tail, kMaxFilenameSize - suffix.size() - 1);
    }
    return utf8_prefix(stem, kMaxFilenameSize - suffix.size() - tail.size()) + suffix + tail;
}

// One mutex per destination directory, never released for the life of the process
std::mutex& directory_mutex(const fs::path& dir) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& slot = registry[dir.string()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

} // namespace

std::string sanitize(const std::string& raw_name) {
    std::string base = raw_name;
    std::size_t sep = base.find_last_of("/\\");
    if (sep != std::string::npos) {
        base = base.substr(sep + 1);
    }

    std::string safe;
    safe.reserve(base.size());
    for (std::size_t i = 0; i < base.size();) {
        unsigned char c = static_cast<unsigned char>(base[i]);
        if (c < 0x80) {
            if (is_allowed_ascii(c)) safe += base[i];
            ++i;
            continue;
        }
        std::size_t length = utf8_sequence_length(base, i);
        if (length == 0) {
            ++i;
            continue;
        }
        safe.append(base, i, length);
        i += length;
    }

    if (safe.size() > kMaxFilenameSize) {
        auto [stem, ext] = split_extension(safe);
        if (ext.size() >= kMaxFilenameSize) {
            safe = utf8_prefix(safe, kMaxFilenameSize);
        } else {
            safe = utf8_prefix(stem, kMaxFilenameSize - ext.size()) + ext;
        }
    }

    if (safe.empty()) {
        throw InvalidFilenameError("Filename '" + raw_name + "' is empty after sanitization");
    }
    if (only_dots(safe)) {
        throw InvalidFilenameError("Filename '" + raw_name + "' is a path traversal sequence");
    }
    if (safe.front() == '.' && base.front() != '.') {
        throw InvalidFilenameError("Filename '" + raw_name + "' has nothing left but an extension");
    }
    return safe;
}

std::pair<std::string, std::string> split_extension(const std::string& name) {
    std::size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return {name, ""};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

std::string resolve_collision(const std::string& safe_name, const std::set<std::string>& existing_names) {
    if (!existing_names.count(safe_name)) {
        return safe_name;
    }

    auto [stem, ext] = split_extension(safe_name);
    for (uint64_t counter = 1;; ++counter) {
        std::string candidate = numbered_name(stem, ext, counter);
        if (!existing_names.count(candidate)) {
            return candidate;
        }
    }
}

fs::path reserve_path(const fs::path& dir, const std::string& safe_name) {
    fs::create_directories(dir);
    fs::path canonical_dir = fs::canonical(dir);

    std::lock_guard<std::mutex> lock(directory_mutex(canonical_dir));

    std::set<std::string> existing;
    for (const auto& entry : fs::directory_iterator(canonical_dir)) {
        existing.insert(entry.path().filename().string());
    }

    fs::path target = canonical_dir / resolve_collision(safe_name, existing);
    int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw fs::filesystem_error("Could not create destination file", target,
                                   std::error_code(errno, std::generic_category()));
    }
    ::close(fd);
    return target;
}

} // namespace naming
