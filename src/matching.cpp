#include "matching.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace rollcall {

namespace {

struct ScoredPair {
    float similarity;
    size_t candidate;
    size_t face;
};

} // namespace

void validateThreshold(double threshold) {
    if (!(threshold >= -1.0 && threshold <= 1.0)) {
        throw ValidationError("threshold " + std::to_string(threshold) + " is outside [-1, 1]");
    }
}

std::vector<Assignment> resolveAssignments(const std::vector<DetectedFace>& faces,
                                           const std::vector<EnrolledIdentity>& candidates,
                                           double threshold) {
    validateThreshold(threshold);

    std::vector<Assignment> assignments;
    if (faces.empty() || candidates.empty()) {
        return assignments;
    }

    const size_t dim = candidates.front().embedding.size();
    for (size_t f = 0; f < faces.size(); f++) {
        if (faces[f].embedding.size() != dim) {
            throw DimensionMismatchError(dim, faces[f].embedding.size(),
                                         "face " + std::to_string(f));
        }
    }

    // Normalize face vectors once; candidates are stored unit length
    std::vector<FaceEncoding> unit_faces;
    unit_faces.reserve(faces.size());
    for (const auto& face : faces) {
        FaceEncoding v = face.embedding;
        l2Normalize(v);
        unit_faces.push_back(std::move(v));
    }

    std::vector<ScoredPair> pairs;
    pairs.reserve(faces.size() * candidates.size());
    for (size_t f = 0; f < unit_faces.size(); f++) {
        for (size_t c = 0; c < candidates.size(); c++) {
            float sim = cosineSimilarity(unit_faces[f], candidates[c].embedding);
            if (sim >= threshold) {  // NaN never passes
                pairs.push_back({sim, c, f});
            }
        }
    }

    std::sort(pairs.begin(), pairs.end(), [&](const ScoredPair& a, const ScoredPair& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        const std::string& roll_a = candidates[a.candidate].roll_no;
        const std::string& roll_b = candidates[b.candidate].roll_no;
        if (roll_a != roll_b) {
            return roll_a < roll_b;
        }
        return a.face < b.face;
    });

    std::vector<bool> face_taken(faces.size(), false);
    std::vector<bool> candidate_taken(candidates.size(), false);

    for (const auto& pair : pairs) {
        if (face_taken[pair.face] || candidate_taken[pair.candidate]) {
            continue;
        }
        face_taken[pair.face] = true;
        candidate_taken[pair.candidate] = true;

        Assignment a;
        a.roll_no = candidates[pair.candidate].roll_no;
        a.name = candidates[pair.candidate].name;
        a.similarity = pair.similarity;
        a.face_index = pair.face;
        a.region = faces[pair.face].region;
        assignments.push_back(std::move(a));
    }

    return assignments;
}

std::vector<Assignment> MatchingEngine::match(const Scope& scope, const EncodedImage& photo,
                                              double threshold, const std::atomic<bool>* cancel) {
    validateThreshold(threshold);
    validateScope(scope);

    auto& logger = Logger::getInstance();

    std::vector<DetectedFace> faces;
    try {
        faces = detectWithTimeout(source_, photo, extraction_timeout_, cancel);
    } catch (const ExtractionError& e) {
        throw ExtractionError("scope " + scope.toString() + ", photo " + photo.name + ": " + e.what());
    }

    std::vector<EnrolledIdentity> candidates = store_.snapshot(scope);

    logger.debug("Matching " + std::to_string(faces.size()) + " face(s) in " + photo.name +
                 " against " + std::to_string(candidates.size()) + " candidate(s) of " + scope.toString());

    if (faces.empty() || candidates.empty()) {
        return {};
    }

    std::vector<Assignment> assignments;
    try {
        assignments = resolveAssignments(faces, candidates, threshold);
    } catch (const DimensionMismatchError& e) {
        throw DimensionMismatchError(e.expected(), e.actual(),
                                     "scope " + scope.toString() + ", photo " + photo.name);
    }

    std::stringstream ss;
    ss << "Photo " << photo.name << ": " << assignments.size() << " of "
       << faces.size() << " face(s) matched (threshold "
       << std::fixed << std::setprecision(2) << threshold << ")";
    logger.info(ss.str());

    return assignments;
}

} // namespace rollcall
