#include "encoding.h"
#include <cmath>
#include <algorithm>

namespace rollcall {

bool l2Normalize(FaceEncoding& v) {
    double norm = 0.0;
    for (float val : v) {
        norm += static_cast<double>(val) * val;
    }
    norm = std::sqrt(norm);

    if (norm <= 0.0 || !std::isfinite(norm)) {
        return false;
    }

    for (float& val : v) {
        val = static_cast<float>(val / norm);
    }
    return true;
}

float cosineSimilarity(const FaceEncoding& a, const FaceEncoding& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));

    // Clamp floating point overshoot
    return static_cast<float>(std::clamp(sim, -1.0, 1.0));
}

FaceEncoding canonicalEncoding(const std::vector<FaceEncoding>& samples) {
    if (samples.empty()) {
        return {};
    }

    const size_t dim = samples.front().size();
    std::vector<double> sum(dim, 0.0);
    size_t used = 0;

    for (const auto& sample : samples) {
        if (sample.size() != dim) {
            return {};
        }
        FaceEncoding unit = sample;
        if (!l2Normalize(unit)) {
            continue;
        }
        for (size_t i = 0; i < dim; i++) {
            sum[i] += unit[i];
        }
        used++;
    }

    if (used == 0) {
        return {};
    }

    FaceEncoding mean(dim);
    for (size_t i = 0; i < dim; i++) {
        mean[i] = static_cast<float>(sum[i] / static_cast<double>(used));
    }

    // Opposing samples can cancel out completely
    if (!l2Normalize(mean)) {
        return {};
    }
    return mean;
}

} // namespace rollcall
