/**
 * @file feasibility_oracle.hpp
 * @brief Wraps a codec to answer "does quality Q fit the byte budget?".
 */

#ifndef KBFIT_FEASIBILITY_ORACLE_HPP
#define KBFIT_FEASIBILITY_ORACLE_HPP

#include "codec.hpp"
#include "image.hpp"
#include "search_types.hpp"
#include <cstddef>
#include <cstdint>

namespace kbfit {

class EventBus;

/**
 * @brief Encode-and-measure oracle for one image, one codec and one target.
 *
 * @details The oracle borrows the codec, the image and the optional
 * event bus; all three must outlive it. It performs no caching: each
 * probe is a full encode, and the returned ProbeResult hands the bytes
 * to the caller for reuse.
 */
class FeasibilityOracle {
public:
    /**
     * @param codec Encoder to call.
     * @param image Image to encode on every probe.
     * @param target_max_bytes Byte budget used by is_feasible().
     * @param bus Optional bus receiving one ProbeEvent per probe.
     */
    FeasibilityOracle(const ICodec& codec,
                      const Image& image,
                      std::uintmax_t target_max_bytes,
                      const EventBus* bus = nullptr);

    /**
     * @brief Encode at the given quality and measure the result.
     * @param quality Quality value to probe.
     * @return The quality, the byte length and the encoded bytes.
     * @throws EncodingError if the codec raises CodecFailure.
     */
    [[nodiscard]] ProbeResult probe(int quality);

    /// @return True if the probe fits the byte budget.
    [[nodiscard]] bool is_feasible(const ProbeResult& result) const noexcept {
        return result.size <= target_max_bytes_;
    }

    [[nodiscard]] std::uintmax_t target_max_bytes() const noexcept { return target_max_bytes_; }

    /// @return Number of probes performed so far.
    [[nodiscard]] std::size_t probe_count() const noexcept { return probe_count_; }

    [[nodiscard]] const ICodec& codec() const noexcept { return codec_; }

private:
    const ICodec& codec_;
    const Image& image_;
    std::uintmax_t target_max_bytes_;
    const EventBus* bus_;
    std::size_t probe_count_ = 0;
};

} // namespace kbfit

#endif // KBFIT_FEASIBILITY_ORACLE_HPP
