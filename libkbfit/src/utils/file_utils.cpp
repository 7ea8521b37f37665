/**
 * @file file_utils.cpp
 */

#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {

    struct FileCloser {
        void operator()(FILE* f) const noexcept { std::fclose(f); }
    };

    using FilePtr = std::unique_ptr<FILE, FileCloser>;

    std::filesystem::path resolve(const std::filesystem::path& p) {
        std::error_code ec;
        auto abs = std::filesystem::weakly_canonical(std::filesystem::absolute(p), ec);
        if (ec) {
            abs = std::filesystem::absolute(p).lexically_normal();
        }
        // "dir/" and "dir" are the same directory
        if (!abs.has_filename() && abs.has_parent_path()) {
            abs = abs.parent_path();
        }
        return abs;
    }

} // namespace

namespace kbfit {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
        return std::fopen(path.string().c_str(), mode);
    }

    std::vector<uint8_t> read_file(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + path.string(), "file_utils");
            throw std::runtime_error("input file not found: " + path.string());
        }

        const FilePtr f(open_file(path, "rb"));
        if (!f) {
            Logger::log(LogLevel::Error, "Cannot open: " + path.string(), "file_utils");
            throw std::runtime_error("cannot open file: " + path.string());
        }

        std::vector<uint8_t> data;
        uint8_t buf[64 * 1024];
        std::size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), f.get())) > 0) {
            data.insert(data.end(), buf, buf + n);
        }
        if (std::ferror(f.get())) {
            Logger::log(LogLevel::Error, "Read error on " + path.string(), "file_utils");
            throw std::runtime_error("error reading file: " + path.string());
        }

        Logger::log(LogLevel::Debug, "Read " + std::to_string(data.size()) + " bytes from " + path.string(),
                    "file_utils");
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::span<const uint8_t> data) {
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                Logger::log(LogLevel::Error, "Failed to create dir: " + path.parent_path().string() +
                            " (" + ec.message() + ")", "file_utils");
                throw std::runtime_error("cannot create directory " + path.parent_path().string() +
                                         ": " + ec.message());
            }
        }

        auto tmp = path;
        tmp += ".part";
        {
            const FilePtr f(open_file(tmp, "wb"));
            if (!f) {
                throw std::runtime_error("cannot open for writing: " + tmp.string());
            }
            if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f.get()) != data.size()) {
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("short write to " + tmp.string());
            }
            if (std::fflush(f.get()) != 0) {
                std::filesystem::remove(tmp, ec);
                throw std::runtime_error("flush failed on " + tmp.string());
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Rename failed: " + tmp.string() + " -> " + path.string() +
                        " (" + ec.message() + ")", "file_utils");
            std::error_code rm_ec;
            std::filesystem::remove(tmp, rm_ec);
            throw std::runtime_error("cannot move output into place: " + ec.message());
        }
        Logger::log(LogLevel::Debug, "Wrote " + std::to_string(data.size()) + " bytes to " + path.string(),
                    "file_utils");
    }

    std::filesystem::path build_output_path(const std::filesystem::path& input,
                                            const std::filesystem::path& out_dir,
                                            const OutputFormat format) {
        std::string name = input.stem().string();
        name += "_out";
        name += extension_for(format);
        return out_dir / name;
    }

    bool same_directory(const std::filesystem::path& a, const std::filesystem::path& b) {
        std::error_code ec;
        if (std::filesystem::exists(a, ec) && std::filesystem::exists(b, ec)) {
            const bool eq = std::filesystem::equivalent(a, b, ec);
            if (!ec) return eq;
        }
        return resolve(a) == resolve(b);
    }

} // namespace kbfit
