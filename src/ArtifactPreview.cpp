#include "ArtifactPreview.h"
#include "TextUtil.h"
#include "Logger.h"
#include <algorithm>
#include <filesystem>
#include <boost/iostreams/device/mapped_file.hpp>

namespace fs = std::filesystem;

bool looks_binary(const char* data, size_t size) {
    for (size_t i = 0; i < size; ++i) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == '\t' || c == '\n' || c == '\r') continue;
        if (c < 0x20 || c == 0x7F) return true;
    }
    return false;
}

PreviewResult preview_artifact(const std::string& path) {
    PreviewResult result;
    std::error_code ec;

    fs::file_status st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        result.error = "File not found: " + path;
        return result;
    }
    if (!fs::is_regular_file(st)) {
        result.error = "Not a regular file: " + path;
        return result;
    }

    auto size = fs::file_size(path, ec);
    if (ec) {
        result.error = "Cannot read file size: " + ec.message();
        return result;
    }
    // mmap файла нулевой длины невозможен
    if (size == 0) return result;

    const size_t length = std::min<size_t>(static_cast<size_t>(size), PREVIEW_MAX_BYTES);
    try {
        boost::iostreams::mapped_file_source mmap(path, length);
        if (!mmap.is_open()) {
            result.error = "Cannot open file: " + path;
            return result;
        }
        result.bytes_read = mmap.size();
        if (looks_binary(mmap.data(), mmap.size())) {
            result.is_binary = true;
            result.content = BINARY_REDACTION_MARKER;
        } else {
            result.content = sanitize_utf8(std::string(mmap.data(), mmap.size()));
        }
    }
    catch (const std::exception& e) {
        Logger::warn("Preview failed for " + path + ": " + e.what());
        result.error = std::string("Cannot read file: ") + e.what();
    }
    return result;
}
