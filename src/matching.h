#ifndef ROLLCALL_MATCHING_H
#define ROLLCALL_MATCHING_H

#include "embedding_source.h"
#include "identity.h"
#include "image.h"
#include "store/identity_store.h"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace rollcall {

constexpr double DEFAULT_MATCH_THRESHOLD = 0.3;

// One detected face paired with one enrolled identity
struct Assignment {
    std::string roll_no;
    std::string name;
    float similarity = 0.0f;
    size_t face_index = 0;  // position in the detector's output for the photo
    Rect region;
};

// Throws ValidationError unless -1 <= threshold <= 1
void validateThreshold(double threshold);

/**
 * Conflict-free face/identity assignment.
 *
 * Scores every (face, candidate) pair by cosine similarity, drops pairs below
 * the threshold, then accepts pairs greedily by descending similarity (ties:
 * roll number ascending, then face index ascending) while both sides are free.
 * Each face and each roll number appears in at most one assignment.
 *
 * @throws ValidationError for a threshold outside [-1, 1]
 * @throws DimensionMismatchError when a face vector and the candidates differ in length
 */
std::vector<Assignment> resolveAssignments(const std::vector<DetectedFace>& faces,
                                           const std::vector<EnrolledIdentity>& candidates,
                                           double threshold);

class MatchingEngine {
public:
    MatchingEngine(EmbeddingSource& source, IdentityStore& store,
                   std::chrono::milliseconds extraction_timeout = std::chrono::milliseconds(0))
        : source_(source), store_(store), extraction_timeout_(extraction_timeout) {}

    /**
     * Identify the enrolled people of `scope` in one photo.
     *
     * Zero faces or no enrolled candidates give an empty result.
     *
     * @throws ExtractionError if the photo cannot be processed (fatal for the photo)
     * @throws ValidationError, DimensionMismatchError, StoreError
     */
    std::vector<Assignment> match(const Scope& scope, const EncodedImage& photo,
                                  double threshold = DEFAULT_MATCH_THRESHOLD,
                                  const std::atomic<bool>* cancel = nullptr);

private:
    EmbeddingSource& source_;
    IdentityStore& store_;
    std::chrono::milliseconds extraction_timeout_;
};

} // namespace rollcall

#endif // ROLLCALL_MATCHING_H
