#undef NDEBUG
#include "enrollment.h"
#include "store/database.h"
#include "store/identity_store.h"
#include "fake_embedding_source.h"
#include "test_util.h"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace rollcall;
using namespace rollcall::test;

namespace {

constexpr size_t DIM = 16;

const Scope CSE_A{"CSE", "A", std::nullopt};

PersonFolder folder(const std::string& label, const std::vector<std::string>& image_names) {
    PersonFolder f;
    f.label = label;
    for (const auto& name : image_names) {
        f.images.push_back({name, {}});
    }
    return f;
}

const SkippedEntry* findSkip(const EnrollmentReport& report, const std::string& folder_label) {
    for (const auto& s : report.skipped) {
        if (s.folder == folder_label) return &s;
    }
    return nullptr;
}

const EnrolledEntry* findEnrolled(const EnrollmentReport& report, const std::string& roll_no) {
    for (const auto& e : report.enrolled) {
        if (e.roll_no == roll_no) return &e;
    }
    return nullptr;
}

} // namespace

void testFiveImagesFourFaces() {
    std::cout << "Testing 5 images with 4 usable faces..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);

    for (int i = 1; i <= 4; i++) {
        source.add("aman_" + std::to_string(i) + ".jpg", {makeFace(vectorWithSimilarity(DIM, 0, i, 0.9f))});
    }
    source.add("aman_5.jpg", {});  // no face

    std::vector<PersonFolder> folders = {
        folder("21045001_aman_meena", {"aman_1.jpg", "aman_2.jpg", "aman_3.jpg", "aman_4.jpg", "aman_5.jpg"}),
        folder("invalidfoldername", {"aman_1.jpg"}),
    };

    EnrollmentAggregator aggregator(source, store);
    EnrollmentReport report = aggregator.enroll(CSE_A, folders);

    assert(report.enrolled.size() == 1);
    assert(report.enrolled[0].roll_no == "21045001");
    assert(report.enrolled[0].name == "aman_meena");
    assert(report.enrolled[0].images_processed == 4);
    assert(report.enrolled[0].images_total == 5);

    assert(report.skipped.size() == 1);
    assert(report.skipped[0].folder == "invalidfoldername");
    assert(report.skipped[0].reason == ErrorKind::MissingSeparator);

    auto stored = store.get("21045001");
    assert(stored.has_value());
    assert(stored->sample_count == 4);
    assert(stored->embedding.size() == DIM);
    assert(stored->class_name == "CSE" && stored->section == "A" && !stored->subject);

    // Canonical embedding is the normalized mean: unit length, aligned with the shared axis
    float norm = 0.0f;
    for (float v : stored->embedding) norm += v * v;
    assert(std::fabs(norm - 1.0f) < 1e-4f);
    assert(cosineSimilarity(stored->embedding, axisVector(DIM, 0)) > 0.95f);

    assert(store.dimension().has_value() && *store.dimension() == DIM);

    std::cout << "  PASSED" << std::endl;
}

void testDuplicateRollInBatch() {
    std::cout << "Testing duplicate roll number in one batch..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("a.jpg", {makeFace(axisVector(DIM, 0))});
    source.add("b.jpg", {makeFace(axisVector(DIM, 1))});

    EnrollmentAggregator aggregator(source, store);
    EnrollmentReport report = aggregator.enroll(CSE_A, {
        folder("21045001_a", {"a.jpg"}),
        folder("21045001_b", {"b.jpg"}),
    });

    assert(report.enrolled.size() == 1);
    assert(report.enrolled[0].name == "a");
    const SkippedEntry* skip = findSkip(report, "21045001_b");
    assert(skip != nullptr);
    assert(skip->reason == ErrorKind::DuplicateInBatch);

    auto stored = store.get("21045001");
    assert(stored && stored->name == "a");
    assert(cosineSimilarity(stored->embedding, axisVector(DIM, 0)) > 0.99f);

    std::cout << "  PASSED" << std::endl;
}

void testSkipReasons() {
    std::cout << "Testing per-folder skip reasons..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("ok.jpg", {makeFace(axisVector(DIM, 0))});
    source.add("blank.jpg", {});
    source.add("short.jpg", {makeFace(axisVector(DIM - 1, 0))});

    EnrollmentOptions options;
    options.workers = 3;
    EnrollmentAggregator aggregator(source, store, options);
    EnrollmentReport report = aggregator.enroll(CSE_A, {
        folder("1_ok", {"ok.jpg"}),
        folder("2_blank", {"blank.jpg", "blank.jpg"}),
        folder("3_broken", {"ok.jpg", "corrupt.jpg"}),
        folder("4_short", {"short.jpg"}),
        folder("5_empty", {}),
        folder("_noroll", {"ok.jpg"}),
        folder("bad roll_x", {"ok.jpg"}),
    });

    assert(report.enrolled.size() == 1);
    assert(findEnrolled(report, "1") != nullptr);
    assert(findSkip(report, "2_blank")->reason == ErrorKind::NoUsableImages);
    assert(findSkip(report, "3_broken")->reason == ErrorKind::ExtractionFailure);
    assert(findSkip(report, "3_broken")->detail.find("corrupt.jpg") != std::string::npos);
    assert(findSkip(report, "4_short")->reason == ErrorKind::DimensionMismatch);
    assert(findSkip(report, "5_empty")->reason == ErrorKind::NoUsableImages);
    assert(findSkip(report, "_noroll")->reason == ErrorKind::EmptyField);
    assert(findSkip(report, "bad roll_x")->reason == ErrorKind::InvalidRollCode);

    // Report keeps input order
    assert(report.skipped.front().folder == "2_blank");
    assert(report.skipped.back().folder == "bad roll_x");

    // Only the good folder reached the store
    assert(store.count() == 1);
    assert(!store.get("3"));

    std::cout << "  PASSED" << std::endl;
}

void testMultiFaceImageUsesLargest() {
    std::cout << "Testing multi-face enrollment image..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("pair.jpg", {makeFace(axisVector(DIM, 1), 0, 0, 10), makeFace(axisVector(DIM, 2), 30, 0, 40)});

    EnrollmentAggregator aggregator(source, store);
    EnrollmentReport report = aggregator.enroll(CSE_A, {folder("7_riya", {"pair.jpg"})});

    assert(report.enrolled.size() == 1);
    assert(report.enrolled[0].images_processed == 1);
    auto stored = store.get("7");
    assert(cosineSimilarity(stored->embedding, axisVector(DIM, 2)) > 0.99f);

    std::cout << "  PASSED" << std::endl;
}

void testReenrollmentReplaces() {
    std::cout << "Testing re-enrollment replaces the identity..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("first.jpg", {makeFace(axisVector(DIM, 3))});
    source.add("second.jpg", {makeFace(axisVector(DIM, 4))});

    EnrollmentAggregator aggregator(source, store);
    aggregator.enroll(CSE_A, {folder("9_old name", {"first.jpg"})});
    Scope maths{"CSE", "A", std::string("Maths")};
    aggregator.enroll(maths, {folder("9_new name", {"second.jpg", "second.jpg"})});

    assert(store.count() == 1);
    auto stored = store.get("9");
    assert(stored->name == "new name");
    assert(stored->subject && *stored->subject == "Maths");
    assert(stored->sample_count == 2);
    assert(cosineSimilarity(stored->embedding, axisVector(DIM, 4)) > 0.99f);
    assert(cosineSimilarity(stored->embedding, axisVector(DIM, 3)) < 0.01f);

    std::cout << "  PASSED" << std::endl;
}

void testSourceDimensionMismatch() {
    std::cout << "Testing source dimension differing from the store..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);

    FakeEmbeddingSource source(DIM);
    source.add("a.jpg", {makeFace(axisVector(DIM, 0))});
    EnrollmentAggregator(source, store).enroll(CSE_A, {folder("1_a", {"a.jpg"})});

    FakeEmbeddingSource wider(DIM * 2);
    wider.add("b.jpg", {makeFace(axisVector(DIM * 2, 0))});
    bool threw = false;
    try {
        EnrollmentAggregator(wider, store).enroll(CSE_A, {folder("2_b", {"b.jpg"})});
    } catch (const DimensionMismatchError& e) {
        threw = true;
        assert(e.expected() == DIM);
        assert(e.actual() == DIM * 2);
    }
    assert(threw);
    assert(wider.calls() == 0);
    assert(store.count() == 1);

    std::cout << "  PASSED" << std::endl;
}

void testCancellation() {
    std::cout << "Testing cancelled enrollment..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("a.jpg", {makeFace(axisVector(DIM, 0))});

    std::atomic<bool> cancel(true);
    EnrollmentAggregator aggregator(source, store);
    EnrollmentReport report = aggregator.enroll(CSE_A, {
        folder("1_a", {"a.jpg"}),
        folder("2_b", {"a.jpg"}),
    }, &cancel);

    assert(report.enrolled.empty());
    assert(report.skipped.size() == 2);
    for (const auto& s : report.skipped) {
        assert(s.reason == ErrorKind::Cancelled);
    }
    assert(store.count() == 0);

    std::cout << "  PASSED" << std::endl;
}

void testExtractionTimeoutSkipsFolder() {
    std::cout << "Testing extraction timeout during enrollment..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);
    source.add("slow.jpg", {makeFace(axisVector(DIM, 0))});
    source.setDelay(std::chrono::milliseconds(1000));

    EnrollmentOptions options;
    options.extraction_timeout = std::chrono::milliseconds(50);
    EnrollmentReport report = EnrollmentAggregator(source, store, options)
        .enroll(CSE_A, {folder("1_slow", {"slow.jpg"})});

    assert(report.enrolled.empty());
    assert(report.skipped.size() == 1);
    assert(report.skipped[0].reason == ErrorKind::ExtractionFailure);
    assert(store.count() == 0);

    std::cout << "  PASSED" << std::endl;
}

void testInvalidScope() {
    std::cout << "Testing invalid scope..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);

    bool threw = false;
    try {
        EnrollmentAggregator(source, store).enroll({"CSE", "", std::nullopt}, {folder("1_a", {"a.jpg"})});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASSED" << std::endl;
}

void testFolderFailureOutsideErrorHierarchy() {
    std::cout << "Testing an out-of-memory folder is skipped, siblings kept..." << std::endl;

    TempDir dir("rollcall_enroll");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    FakeEmbeddingSource source(DIM);

    source.add("good.jpg", {makeFace(axisVector(DIM, 0))});
    source.add("after.jpg", {makeFace(axisVector(DIM, 2))});
    source.addOutOfMemory("huge.png");

    std::vector<PersonFolder> folders = {
        folder("1001_good", {"good.jpg"}),
        folder("1002_bad", {"good.jpg", "huge.png"}),
        folder("1003_after", {"after.jpg"}),
    };

    for (int workers : {1, 3}) {
        EnrollmentOptions options;
        options.workers = workers;
        EnrollmentAggregator aggregator(source, store, options);
        EnrollmentReport report = aggregator.enroll(CSE_A, folders);

        assert(report.enrolled.size() == 2);
        assert(report.enrolled[0].roll_no == "1001");
        assert(report.enrolled[1].roll_no == "1003");
        assert(report.skipped.size() == 1);

        const SkippedEntry* bad = findSkip(report, "1002_bad");
        assert(bad != nullptr);
        assert(bad->reason == ErrorKind::ExtractionFailure);
        assert(bad->detail.find("huge.png") != std::string::npos);
    }

    assert(store.count() == 2);
    assert(!store.get("1002"));

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Enrollment Tests ===" << std::endl;

    testFiveImagesFourFaces();
    testDuplicateRollInBatch();
    testSkipReasons();
    testMultiFaceImageUsesLargest();
    testReenrollmentReplaces();
    testSourceDimensionMismatch();
    testCancellation();
    testExtractionTimeoutSkipsFolder();
    testInvalidScope();
    testFolderFailureOutsideErrorHierarchy();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
