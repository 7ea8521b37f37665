/**
 * @file compressor.hpp
 * @brief Public API for the kbfit library.
 */

#ifndef KBFIT_COMPRESSOR_HPP
#define KBFIT_COMPRESSOR_HPP

#include "codec.hpp"
#include "image.hpp"
#include "output_format.hpp"
#include "search_types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kbfit {

class EventBus;

/**
 * @brief Everything needed to fit one image into a byte budget.
 */
struct CompressionRequest {
    std::filesystem::path input;          ///< Used by compress(request) only
    std::uintmax_t target_max_bytes = 0;  ///< Must be > 0
    OutputFormat format = OutputFormat::Jpeg;
    QualityBounds bounds{};
    Rgb background{};                     ///< Alpha flattening colour for JPEG
    bool probe_bounds_first = false;
};

/**
 * @brief What the facade produced for a request.
 *
 * bytes holds the chosen encoding: the best feasible probe, the
 * min_quality fallback when nothing fits, or the single PNG encode.
 */
struct CompressionResult {
    OutputFormat format = OutputFormat::Jpeg;
    TerminalReason reason = TerminalReason::FeasibleFound;
    std::optional<int> quality;           ///< Absent for PNG
    std::size_t iterations = 0;
    int width = 0;
    int height = 0;
    std::uintmax_t target_max_bytes = 0;
    std::vector<uint8_t> bytes;
    bool meets_target = false;
    std::vector<ProbeRecord> trail;

    [[nodiscard]] std::size_t size() const noexcept { return bytes.size(); }
};

/**
 * @brief Interface for receiving progress events during a compression.
 */
struct CompressionObserver {
    virtual ~CompressionObserver() = default;

    virtual void onSearchStart(OutputFormat format, const QualityBounds& bounds,
                               std::uintmax_t target_max_bytes) {}

    virtual void onProbe(int quality, std::size_t size, bool feasible) {}

    virtual void onSearchComplete(TerminalReason reason, std::optional<int> quality,
                                  std::size_t size, std::size_t iterations) {}

    virtual void onBestEffortEncode(OutputFormat format, std::size_t size, bool meets_target) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the kbfit library.
 *
 * @details Validates a request, routes it through select_strategy() and
 * either runs search_max_quality() or a single best-effort encode.
 * Blocking; uses PIMPL to keep codec headers out of the public API.
 * Separate instances may be used from separate threads.
 */
class Compressor {
public:
    Compressor();
    ~Compressor();

    Compressor(const Compressor&) = delete;
    Compressor& operator=(const Compressor&) = delete;
    Compressor(Compressor&&) noexcept;
    Compressor& operator=(Compressor&&) noexcept;

    /**
     * @brief Add a codec that takes precedence over the built-in one
     * for the same format.
     */
    Compressor& registerCodec(std::unique_ptr<ICodec> codec);

    /**
     * @brief Sets the observer for progress events and log messages.
     * The caller retains ownership; pass nullptr to detach.
     *
     * onLog() only receives lines logged by this instance's compress(),
     * on the thread running it; other instances' logs are not forwarded.
     */
    void setObserver(CompressionObserver* observer);

    /**
     * @brief Event bus on which search events are published.
     */
    [[nodiscard]] EventBus& events();

    /**
     * @brief Load request.input from disk and compress it.
     * @throws std::runtime_error if the input cannot be read.
     * @throws CodecFailure if it cannot be decoded.
     * @throws InvalidBounds, EncodingError as the in-memory overload.
     */
    [[nodiscard]] CompressionResult compress(const CompressionRequest& request);

    /**
     * @brief Compress an already decoded image; request.input is ignored.
     * @throws InvalidBounds before any encode if the request is invalid.
     * @throws EncodingError if a search probe fails.
     * @throws CodecFailure if the best-effort encode fails, no codec
     * is registered for the format, or the codec's has_quality_knob()
     * disagrees with select_strategy() for the format.
     */
    [[nodiscard]] CompressionResult compress(const Image& image, const CompressionRequest& request);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kbfit

#endif // KBFIT_COMPRESSOR_HPP
