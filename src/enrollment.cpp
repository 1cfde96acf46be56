#include "enrollment.h"
#include "image_io.h"
#include "logger.h"
#include <algorithm>
#include <exception>
#include <map>
#include <optional>
#include <thread>

namespace rollcall {

namespace {

bool isCancelled(const std::atomic<bool>* cancel) {
    return cancel != nullptr && cancel->load();
}

} // namespace

EnrollmentAggregator::FolderOutcome EnrollmentAggregator::processFolder(
    const Scope& scope, const PersonFolder& folder, const Identifier& id,
    const std::atomic<bool>* cancel) {

    auto& logger = Logger::getInstance();
    FolderOutcome outcome;
    outcome.skip.folder = folder.label;

    auto skip = [&](ErrorKind reason, const std::string& detail) {
        outcome.enrolled = false;
        outcome.skip.reason = reason;
        outcome.skip.detail = detail;
        return outcome;
    };

    const size_t dim = source_.dimension();
    const size_t total = folder.images.size() + folder.image_paths.size();
    std::vector<FaceEncoding> samples;

    for (size_t i = 0; i < total; i++) {
        if (isCancelled(cancel)) {
            return skip(ErrorKind::Cancelled, "enrollment cancelled");
        }

        EncodedImage loaded;
        const EncodedImage* image = nullptr;
        if (i < folder.images.size()) {
            image = &folder.images[i];
        } else {
            const std::string& path = folder.image_paths[i - folder.images.size()];
            loaded.name = path;
            if (!readFileBytes(path, loaded.bytes)) {
                return skip(ErrorKind::ExtractionFailure, "cannot read image " + path);
            }
            image = &loaded;
        }

        std::vector<DetectedFace> faces;
        try {
            faces = detectWithTimeout(source_, *image, options_.extraction_timeout, cancel);
        } catch (const CancelledError&) {
            return skip(ErrorKind::Cancelled, "enrollment cancelled");
        } catch (const ExtractionError& e) {
            return skip(ErrorKind::ExtractionFailure, image->name + ": " + e.what());
        } catch (const std::exception& e) {
            logger.error("Extraction failed on " + image->name + ": " + e.what());
            return skip(ErrorKind::ExtractionFailure, image->name + ": " + e.what());
        }

        if (faces.empty()) {
            logger.debug("No face found in " + image->name + " (" + folder.label + ")");
            continue;
        }

        auto chosen = faces.begin();
        if (faces.size() > 1) {
            // Largest region wins; ties keep the detector's order
            chosen = std::max_element(faces.begin(), faces.end(),
                [](const DetectedFace& a, const DetectedFace& b) {
                    return a.region.area() < b.region.area();
                });
            logger.warning(std::to_string(faces.size()) + " faces in enrollment image " + image->name +
                           " (" + folder.label + "), using the largest");
        }

        if (chosen->embedding.size() != dim) {
            return skip(ErrorKind::DimensionMismatch,
                        image->name + ": embedding has " + std::to_string(chosen->embedding.size()) +
                        " values, source declares " + std::to_string(dim));
        }

        samples.push_back(chosen->embedding);
    }

    if (samples.empty()) {
        return skip(ErrorKind::NoUsableImages,
                    "no face found in any of " + std::to_string(total) + " image(s)");
    }

    FaceEncoding canonical = canonicalEncoding(samples);
    if (canonical.empty()) {
        return skip(ErrorKind::NoUsableImages, "sample embeddings have zero length");
    }

    if (isCancelled(cancel)) {
        return skip(ErrorKind::Cancelled, "enrollment cancelled");
    }

    EnrolledIdentity identity;
    identity.roll_no = id.roll_no;
    identity.name = id.name;
    identity.class_name = scope.class_name;
    identity.section = scope.section;
    identity.subject = scope.subject;
    identity.embedding = std::move(canonical);
    identity.sample_count = samples.size();

    try {
        store_.upsert(identity);
    } catch (const Error& e) {
        return skip(e.kind(), e.what());
    } catch (const std::exception& e) {
        logger.error("Storing " + id.roll_no + " failed: " + e.what());
        return skip(ErrorKind::StoreError, e.what());
    }

    outcome.enrolled = true;
    outcome.entry.roll_no = id.roll_no;
    outcome.entry.name = id.name;
    outcome.entry.images_processed = samples.size();
    outcome.entry.images_total = total;
    return outcome;
}

EnrollmentReport EnrollmentAggregator::enroll(const Scope& scope, const std::vector<PersonFolder>& folders,
                                              const std::atomic<bool>* cancel) {
    validateScope(scope);

    auto& logger = Logger::getInstance();
    const std::string scope_name = scope.toString();

    auto store_dim = store_.dimension();
    if (store_dim && *store_dim != source_.dimension()) {
        throw DimensionMismatchError(*store_dim, source_.dimension(),
                                     "enrolling into " + scope_name);
    }

    // Sequential pass: parse labels, first occurrence of a roll number wins
    std::vector<std::optional<FolderOutcome>> outcomes(folders.size());
    std::vector<Identifier> ids(folders.size());
    std::map<std::string, std::string> first_label;
    std::vector<size_t> work;

    for (size_t i = 0; i < folders.size(); i++) {
        ParseError err;
        if (!parseLabel(folders[i].label, ids[i], err)) {
            FolderOutcome skipped;
            skipped.skip = {folders[i].label, err.kind, err.detail};
            outcomes[i] = skipped;
            continue;
        }

        auto it = first_label.find(ids[i].roll_no);
        if (it != first_label.end()) {
            FolderOutcome skipped;
            skipped.skip = {folders[i].label, ErrorKind::DuplicateInBatch,
                            "roll number " + ids[i].roll_no + " already used by " + it->second};
            outcomes[i] = skipped;
            continue;
        }
        first_label[ids[i].roll_no] = folders[i].label;
        work.push_back(i);
    }

    // Parallel pass: chunks of folder indices per worker
    const size_t num_threads = std::max<size_t>(1, std::min<size_t>(
        static_cast<size_t>(std::max(1, options_.workers)), work.size()));

    if (!work.empty()) {
        std::vector<std::vector<size_t>> chunks(num_threads);
        for (size_t i = 0; i < work.size(); ++i) {
            chunks[i % num_threads].push_back(work[i]);
        }

        std::vector<std::thread> threads;
        for (size_t t = 0; t < num_threads; ++t) {
            threads.emplace_back([this, &scope, &folders, &ids, &outcomes, &chunks, cancel, t]() {
                for (size_t idx : chunks[t]) {
                    // A folder that fails in any way is a skip; its siblings carry on
                    try {
                        outcomes[idx] = processFolder(scope, folders[idx], ids[idx], cancel);
                    } catch (const std::exception& e) {
                        FolderOutcome failed;
                        failed.skip = {folders[idx].label, ErrorKind::ExtractionFailure, e.what()};
                        outcomes[idx] = failed;
                    }
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }
    }

    EnrollmentReport report;
    for (size_t i = 0; i < folders.size(); i++) {
        const FolderOutcome& outcome = *outcomes[i];
        if (outcome.enrolled) {
            logger.auditEnrollment(scope_name, outcome.entry.roll_no, outcome.entry.name,
                                   outcome.entry.images_processed);
            report.enrolled.push_back(outcome.entry);
        } else {
            logger.auditSkip(scope_name, outcome.skip.folder,
                             errorKindName(outcome.skip.reason), outcome.skip.detail);
            report.skipped.push_back(outcome.skip);
        }
    }

    logger.info("Enrollment into " + scope_name + ": " + std::to_string(report.enrolled.size()) +
                " enrolled, " + std::to_string(report.skipped.size()) + " skipped");
    return report;
}

} // namespace rollcall
