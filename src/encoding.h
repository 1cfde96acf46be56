#ifndef ROLLCALL_ENCODING_H
#define ROLLCALL_ENCODING_H

#include <cstddef>
#include <vector>

namespace rollcall {

using FaceEncoding = std::vector<float>;

// ============================================================================
// FACE ENCODING DIMENSION
// ============================================================================
// The real dimension is read from the recognition model's output layer and
// pinned per store on the first enrollment. This value is only used when a
// model's .param file does not declare its InnerProduct output size.
//
// Common model dimensions:
// - SFace: 128D
// - MobileFaceNet: 192D
// - ArcFace-R50 / WebFace / Glint360K: 512D
// ============================================================================
constexpr size_t FACE_ENCODING_DIM = 512;

// Scale to unit length in place. Returns false (and leaves v alone) for a zero vector.
bool l2Normalize(FaceEncoding& v);

// Cosine similarity in [-1, 1]. Inputs need not be normalized.
// Sizes must match; empty or zero vectors score 0.
float cosineSimilarity(const FaceEncoding& a, const FaceEncoding& b);

// Canonical embedding of a set of samples: normalize each sample,
// take the arithmetic mean, normalize the mean.
// All samples must share one dimension. Returns an empty vector when no
// sample has non-zero length.
FaceEncoding canonicalEncoding(const std::vector<FaceEncoding>& samples);

} // namespace rollcall

#endif // ROLLCALL_ENCODING_H
