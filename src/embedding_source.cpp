#include "embedding_source.h"
#include "errors.h"
#include "logger.h"
#include <future>

namespace rollcall {

std::vector<DetectedFace> detectWithTimeout(EmbeddingSource& source,
                                            const EncodedImage& image,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool>* outer_cancel) {
    if (outer_cancel != nullptr && outer_cancel->load()) {
        throw CancelledError("cancelled before processing " + image.name);
    }

    std::atomic<bool> cancel_flag(false);

    if (timeout.count() <= 0) {
        return source.detect(image, outer_cancel != nullptr ? *outer_cancel : cancel_flag);
    }

    std::future<std::vector<DetectedFace>> detect_future = std::async(std::launch::async, [&]() {
        return source.detect(image, cancel_flag);
    });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    bool cancelled = false;

    while (true) {
        auto status = detect_future.wait_for(std::chrono::milliseconds(50));
        if (status == std::future_status::ready) {
            break;
        }
        if (outer_cancel != nullptr && outer_cancel->load()) {
            cancelled = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
    }

    if (timed_out || cancelled) {
        // Cooperative: the worker sees the flag and returns; its result is discarded
        cancel_flag.store(true);
        detect_future.wait();

        if (cancelled) {
            throw CancelledError("cancelled while processing " + image.name);
        }

        Logger::getInstance().warning("Face extraction timed out after " +
            std::to_string(timeout.count()) + "ms: " + image.name);
        throw ExtractionError("extraction timed out after " +
            std::to_string(timeout.count()) + "ms on " + image.name);
    }

    return detect_future.get();
}

} // namespace rollcall
