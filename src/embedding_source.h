#ifndef ROLLCALL_EMBEDDING_SOURCE_H
#define ROLLCALL_EMBEDDING_SOURCE_H

#include "encoding.h"
#include "image.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace rollcall {

// Undecoded image file contents (JPEG/PNG) plus a name used in messages
struct EncodedImage {
    std::string name;
    std::vector<uint8_t> bytes;
};

// One face found in an image. Not persisted.
struct DetectedFace {
    Rect region;
    FaceEncoding embedding;
    float score = 0.0f;  // detector confidence
};

/**
 * Produces detected faces with fixed-dimensionality embeddings.
 *
 * Implementations must be safe to call from several threads at once and
 * should poll `cancel` between expensive stages, returning early (or
 * throwing CancelledError) once it is set.
 * Decode or model failures are reported by throwing ExtractionError.
 */
class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;

    virtual std::vector<DetectedFace> detect(const EncodedImage& image,
                                             const std::atomic<bool>& cancel) = 0;

    // Length of every embedding this source produces
    virtual size_t dimension() const = 0;
};

/**
 * Run source.detect() on a worker and wait at most `timeout`.
 *
 * A zero timeout runs the call inline with no limit. On timeout the worker's
 * cancel flag is raised and ExtractionError is thrown once the worker has
 * returned. If `outer_cancel` is set while waiting, CancelledError is thrown.
 * Exceptions from the source propagate unchanged.
 */
std::vector<DetectedFace> detectWithTimeout(EmbeddingSource& source,
                                            const EncodedImage& image,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool>* outer_cancel = nullptr);

} // namespace rollcall

#endif // ROLLCALL_EMBEDDING_SOURCE_H
