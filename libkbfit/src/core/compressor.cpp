/**
 * @file compressor.cpp
 * @brief Implementation of the public Compressor API.
 */

#include "../../include/compressor.hpp"

#include "../../include/codec_registry.hpp"
#include "../../include/errors.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/feasibility_oracle.hpp"
#include "../../include/format_strategy.hpp"
#include "../../include/image_loader.hpp"
#include "../../include/image_normalizer.hpp"
#include "../../include/log_sink.hpp"
#include "../../include/logger.hpp"
#include "../../include/quality_search.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <utility>

namespace kbfit {

using ThreadSlot = std::atomic<std::thread::id>;

// bridge sink to redirect static logs to the instance observer.
// Logger is process-wide, so only lines logged on the thread that is
// inside this instance's compress() are forwarded.
class BridgeLogSink final : public ILogSink {
    CompressionObserver* observer_;
    const ThreadSlot* owner_;
public:
    BridgeLogSink(CompressionObserver* obs, const ThreadSlot* owner) : observer_(obs), owner_(owner) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (owner_->load() != std::this_thread::get_id()) return;
        observer_->onLog(static_cast<int>(level), std::string(message), std::string(tag));
    }
};

// marks the calling thread as running compress() for the duration of a call
class ActiveCall {
    ThreadSlot& slot_;
public:
    explicit ActiveCall(ThreadSlot& slot) : slot_(slot) { slot_.store(std::this_thread::get_id()); }
    ~ActiveCall() { slot_.store(std::thread::id{}); }

    ActiveCall(const ActiveCall&) = delete;
    ActiveCall& operator=(const ActiveCall&) = delete;
};

struct Compressor::Impl {
    CodecRegistry registry;
    EventBus eventBus;

    CompressionObserver* observer = nullptr;
    const ILogSink* bridgeSink = nullptr;
    ThreadSlot activeThread{};

    Impl() {
        setupEventBridging();
    }

    ~Impl() {
        detachBridgeSink();
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    // subscribed once; handlers read the current observer
    void setupEventBridging() {
        eventBus.subscribe<SearchStartEvent>([this](const SearchStartEvent& e) {
            if (observer) observer->onSearchStart(e.format, e.bounds, e.target_max_bytes);
        });

        eventBus.subscribe<ProbeEvent>([this](const ProbeEvent& e) {
            if (observer) observer->onProbe(e.quality, e.size, e.feasible);
        });

        eventBus.subscribe<SearchCompleteEvent>([this](const SearchCompleteEvent& e) {
            if (observer) observer->onSearchComplete(e.reason, e.quality, e.size, e.iterations);
        });

        eventBus.subscribe<BestEffortEncodeEvent>([this](const BestEffortEncodeEvent& e) {
            if (observer) observer->onBestEffortEncode(e.format, e.size, e.meets_target);
        });
    }

    void detachBridgeSink() {
        if (bridgeSink) {
            Logger::remove_sink(bridgeSink);
            bridgeSink = nullptr;
        }
    }

    const ICodec& codecFor(const OutputFormat format) const {
        const ICodec* codec = registry.find_by_format(format);
        if (!codec) {
            Logger::log(LogLevel::Error, "No codec registered for " + std::string(to_string(format)),
                        "compressor");
            throw CodecFailure("no codec registered for " + std::string(to_string(format)));
        }
        // the codec's own capability must agree with the format's strategy
        const bool searchable = select_strategy(format) == SearchApplicability::Searchable;
        if (codec->has_quality_knob() != searchable) {
            Logger::log(LogLevel::Error,
                        std::string(codec->get_name()) + " disagrees with " + std::string(to_string(format)) +
                        " being " + std::string(to_string(select_strategy(format))),
                        "compressor");
            throw CodecFailure(std::string(codec->get_name()) + (searchable
                ? " has no quality knob for a searchable format"
                : " claims a quality knob for a not-searchable format"));
        }
        return *codec;
    }

    void runSearch(const ICodec& codec, const Image& image,
                   const CompressionRequest& request, CompressionResult& result) const {
        eventBus.publish(SearchStartEvent{request.format, request.bounds, request.target_max_bytes});

        FeasibilityOracle oracle(codec, image, request.target_max_bytes, &eventBus);
        SearchOutcome outcome = search_max_quality(oracle, request.bounds,
                                                   SearchOptions{request.probe_bounds_first});

        result.reason = outcome.reason;
        result.quality = outcome.final_quality();
        result.iterations = outcome.iterations();
        result.trail = std::move(outcome.trail);
        if (outcome.best) {
            result.bytes = std::move(outcome.best->bytes);
            result.meets_target = true;
        } else if (outcome.fallback) {
            result.bytes = std::move(outcome.fallback->bytes);
            result.meets_target = false;
        }
    }

    void runBestEffort(const ICodec& codec, const Image& image,
                       const CompressionRequest& request, CompressionResult& result) const {
        Logger::log(LogLevel::Info,
                    std::string(to_string(request.format)) + " has no quality knob, single best-effort encode",
                    "compressor");

        result.bytes = codec.encode(image, kMaxQuality);
        result.reason = TerminalReason::NotSearchable;
        result.quality.reset();
        result.iterations = 1;
        result.meets_target = result.bytes.size() <= request.target_max_bytes;

        if (!result.meets_target) {
            Logger::log(LogLevel::Warning,
                        "Best-effort " + std::string(to_string(request.format)) + " is " +
                        std::to_string(result.bytes.size()) + " bytes, over the " +
                        std::to_string(request.target_max_bytes) + " byte target",
                        "compressor");
        }
        eventBus.publish(BestEffortEncodeEvent{request.format, result.bytes.size(),
                                               request.target_max_bytes, result.meets_target});
    }

    CompressionResult run(const Image& image, const CompressionRequest& request) const {
        validate_bounds(request.bounds, request.target_max_bytes);
        if (image.empty()) {
            throw CodecFailure("cannot compress an empty image");
        }

        const ICodec& codec = codecFor(request.format);
        const Image normalized = normalize_for_output(image, request.format, request.background);

        CompressionResult result;
        result.format = request.format;
        result.width = normalized.width;
        result.height = normalized.height;
        result.target_max_bytes = request.target_max_bytes;

        const SearchApplicability strategy = select_strategy(request.format);
        Logger::log(LogLevel::Debug,
                    std::string(to_string(request.format)) + " is " + std::string(to_string(strategy)),
                    "compressor");

        switch (strategy) {
            case SearchApplicability::Searchable:
                runSearch(codec, normalized, request, result);
                break;
            case SearchApplicability::NotSearchable:
                runBestEffort(codec, normalized, request, result);
                break;
        }

        eventBus.publish(SearchCompleteEvent{result.reason, result.quality,
                                             result.bytes.size(), result.iterations});
        return result;
    }
};

Compressor::Compressor() : impl_(std::make_unique<Impl>()) {}

Compressor::~Compressor() = default;

Compressor::Compressor(Compressor&&) noexcept = default;
Compressor& Compressor::operator=(Compressor&&) noexcept = default;

Compressor& Compressor::registerCodec(std::unique_ptr<ICodec> codec) {
    impl_->registry.register_codec(std::move(codec));
    return *this;
}

void Compressor::setObserver(CompressionObserver* observer) {
    impl_->detachBridgeSink();
    impl_->observer = observer;

    // inject bridge sink if observer is present
    if (observer) {
        auto sink = std::make_unique<BridgeLogSink>(observer, &impl_->activeThread);
        impl_->bridgeSink = sink.get();
        Logger::add_sink(std::move(sink));
    }
}

EventBus& Compressor::events() {
    return impl_->eventBus;
}

CompressionResult Compressor::compress(const CompressionRequest& request) {
    ActiveCall call(impl_->activeThread);
    // reject a bad request before paying for the decode
    validate_bounds(request.bounds, request.target_max_bytes);
    const Image image = load_image(request.input);
    return impl_->run(image, request);
}

CompressionResult Compressor::compress(const Image& image, const CompressionRequest& request) {
    ActiveCall call(impl_->activeThread);
    return impl_->run(image, request);
}

} // namespace kbfit
