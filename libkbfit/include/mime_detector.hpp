/**
 * @file mime_detector.hpp
 * @brief Input file type detection.
 */

#ifndef KBFIT_MIME_DETECTOR_HPP
#define KBFIT_MIME_DETECTOR_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace kbfit {

    /**
     * @brief Detects the MIME type of image inputs.
     *
     * Uses libmagic. When libmagic cannot classify the data (or its
     * database is unavailable) the file extension is looked up in
     * ext_to_mime instead.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a file.
         *
         * @param path The filesystem path to the file.
         * @return A MIME type (e.g. "image/jpeg"), or
         * "application/octet-stream" if nothing matched.
         */
        static std::string detect(const std::filesystem::path& path);

        /**
         * @brief Detect the MIME type of an in-memory buffer.
         *
         * @param data Encoded file contents.
         * @param name_hint Optional file name used for the extension fallback.
         */
        static std::string detect(std::span<const uint8_t> data,
                                  const std::filesystem::path& name_hint = {});

        /**
         * @brief Extension lookup only, without touching the file.
         */
        static std::string from_extension(const std::filesystem::path& path);
    };

} // namespace kbfit
#endif // KBFIT_MIME_DETECTOR_HPP
