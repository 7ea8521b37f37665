/**
 * @file feasibility_oracle.cpp
 * @brief Implementation of FeasibilityOracle.
 */

#include "../../include/feasibility_oracle.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace kbfit {

FeasibilityOracle::FeasibilityOracle(const ICodec& codec,
                                     const Image& image,
                                     const std::uintmax_t target_max_bytes,
                                     const EventBus* bus)
    : codec_(codec), image_(image), target_max_bytes_(target_max_bytes), bus_(bus) {}

ProbeResult FeasibilityOracle::probe(const int quality) {
    ProbeResult result;
    result.quality = quality;
    try {
        result.bytes = codec_.encode(image_, quality);
    } catch (const CodecFailure& e) {
        Logger::log(LogLevel::Error,
                    std::string(codec_.get_name()) + " failed at quality " + std::to_string(quality) +
                    ": " + e.what(),
                    "oracle");
        throw EncodingError(quality, e.what());
    }
    result.size = result.bytes.size();
    ++probe_count_;

    const bool feasible = is_feasible(result);
    Logger::log(LogLevel::Debug,
                "probe q=" + std::to_string(quality) + " size=" + std::to_string(result.size) +
                (feasible ? " <= " : " > ") + std::to_string(target_max_bytes_),
                "oracle");

    if (bus_) {
        bus_->publish(ProbeEvent{quality, result.size, target_max_bytes_, feasible});
    }
    return result;
}

} // namespace kbfit
