/**
 * @file mime_detector.cpp
 * @brief libmagic backed MIME detection with an extension fallback.
 */

#include <magic.h>
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include "../../include/output_format.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <type_traits>

namespace {

    constexpr const char* kUnknownMime = "application/octet-stream";

    struct MagicCloser {
        void operator()(const magic_t m) const noexcept { magic_close(m); }
    };

    using MagicHandle = std::unique_ptr<std::remove_pointer_t<magic_t>, MagicCloser>;

    /// @return A loaded cookie, or nullptr if libmagic is unusable.
    MagicHandle open_magic() {
        MagicHandle magic(magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR));
        if (!magic) {
            kbfit::Logger::log(kbfit::LogLevel::Warning, "magic_open failed", "libmagic");
            return nullptr;
        }
        if (magic_load(magic.get(), nullptr) != 0) {
            kbfit::Logger::log(kbfit::LogLevel::Warning,
                               std::string("magic_load failed: ") + magic_error(magic.get()),
                               "libmagic");
            return nullptr;
        }
        return magic;
    }

    bool is_useful(const std::string& mime) {
        return !mime.empty() && mime != kUnknownMime;
    }

} // namespace

namespace kbfit {

std::string MimeDetector::from_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto it = ext_to_mime.find(ext);
    return it != ext_to_mime.end() ? it->second : kUnknownMime;
}

std::string MimeDetector::detect(const std::filesystem::path& path) {
    std::string result;
    if (const auto magic = open_magic()) {
        const char* mime = magic_file(magic.get(), path.string().c_str());
        result = mime ? mime : "";
    }
    if (!is_useful(result)) {
        Logger::log(LogLevel::Debug, "libmagic gave no answer for " + path.filename().string() +
                    ", falling back to extension", "libmagic");
        return from_extension(path);
    }
    return result;
}

std::string MimeDetector::detect(const std::span<const uint8_t> data,
                                 const std::filesystem::path& name_hint) {
    std::string result;
    if (const auto magic = open_magic()) {
        const char* mime = magic_buffer(magic.get(), data.data(), data.size());
        result = mime ? mime : "";
    }
    return is_useful(result) ? result : from_extension(name_hint);
}

} // namespace kbfit
