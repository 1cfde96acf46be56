#ifndef ROLLCALL_ENROLLMENT_H
#define ROLLCALL_ENROLLMENT_H

#include "embedding_source.h"
#include "errors.h"
#include "identity.h"
#include "store/identity_store.h"
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace rollcall {

// One person's sample images, labelled "<rollcode>_<name>"
struct PersonFolder {
    std::string label;
    std::vector<EncodedImage> images;       // already in memory
    std::vector<std::string> image_paths;   // read on demand, after `images`
};

struct EnrolledEntry {
    std::string roll_no;
    std::string name;
    size_t images_processed = 0;  // images that contributed a sample
    size_t images_total = 0;
};

struct SkippedEntry {
    std::string folder;
    ErrorKind reason = ErrorKind::NoUsableImages;
    std::string detail;
};

// Every input folder lands in exactly one of the two lists, in input order
struct EnrollmentReport {
    std::vector<EnrolledEntry> enrolled;
    std::vector<SkippedEntry> skipped;
};

struct EnrollmentOptions {
    int workers = 4;
    std::chrono::milliseconds extraction_timeout{0};  // per image, 0 = unlimited
};

/**
 * Builds one canonical embedding per person and upserts it.
 *
 * Labels are parsed and de-duplicated sequentially (first occurrence wins),
 * then folders are processed by a pool of worker threads. Each folder is
 * committed on its own; a failing folder never affects its siblings.
 */
class EnrollmentAggregator {
public:
    EnrollmentAggregator(EmbeddingSource& source, IdentityStore& store,
                         EnrollmentOptions options = EnrollmentOptions())
        : source_(source), store_(store), options_(options) {}

    /**
     * @throws ValidationError for an invalid scope
     * @throws DimensionMismatchError if the source's dimension differs from the store's
     */
    EnrollmentReport enroll(const Scope& scope, const std::vector<PersonFolder>& folders,
                            const std::atomic<bool>* cancel = nullptr);

private:
    struct FolderOutcome {
        bool enrolled = false;
        EnrolledEntry entry;
        SkippedEntry skip;
    };

    FolderOutcome processFolder(const Scope& scope, const PersonFolder& folder,
                                const Identifier& id, const std::atomic<bool>* cancel);

    EmbeddingSource& source_;
    IdentityStore& store_;
    EnrollmentOptions options_;
};

} // namespace rollcall

#endif // ROLLCALL_ENROLLMENT_H
