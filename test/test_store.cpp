#undef NDEBUG
#include "store/attendance_ledger.h"
#include "store/database.h"
#include "store/identity_store.h"
#include "fs_util.h"
#include "fake_embedding_source.h"
#include "test_util.h"
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace rollcall;
using namespace rollcall::test;

namespace {

constexpr size_t DIM = 4;

EnrolledIdentity identity(const std::string& roll, const std::string& cls, const std::string& section,
                          std::optional<std::string> subject = std::nullopt, size_t axis = 0) {
    EnrolledIdentity id;
    id.roll_no = roll;
    id.name = "Name " + roll;
    id.class_name = cls;
    id.section = section;
    id.subject = std::move(subject);
    id.embedding = axisVector(DIM, axis);
    id.sample_count = 3;
    return id;
}

Assignment assignment(const std::string& roll, float similarity, int x = 10) {
    Assignment a;
    a.roll_no = roll;
    a.name = "Name " + roll;
    a.similarity = similarity;
    a.region = Rect(x, 10, 20, 20);
    return a;
}

SessionStamp fixedStamp(const std::string& date, const std::string& time, const std::string& ts) {
    SessionStamp s;
    s.date = date;
    s.time = time;
    s.timestamp = ts;
    return s;
}

} // namespace

void testUpsertAndGet() {
    std::cout << "Testing upsert / get / list..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);

    assert(store.count() == 0);
    assert(!store.dimension());
    assert(!store.get("1"));

    store.upsert(identity("2", "CSE", "A"));
    store.upsert(identity("1", "CSE", "A", std::string("Maths"), 2));
    store.upsert(identity("3", "CSE", "B"));

    assert(store.count() == 3);
    assert(*store.dimension() == DIM);

    auto one = store.get("1");
    assert(one && one->subject && *one->subject == "Maths");
    assert(one->embedding == axisVector(DIM, 2));
    assert(one->sample_count == 3);
    assert(!one->enrolled_at.empty());

    // Ordered by roll number
    auto all = store.list();
    assert(all.size() == 3 && all[0].roll_no == "1" && all[2].roll_no == "3");

    assert(store.list({std::string("CSE"), std::nullopt, std::nullopt}).size() == 3);
    assert(store.list({std::string("CSE"), std::string("A"), std::nullopt}).size() == 2);
    assert(store.list({std::string("CSE"), std::string("A"), std::string("Maths")}).size() == 1);
    assert(store.list({std::string("ECE"), std::nullopt, std::nullopt}).empty());

    bool threw = false;
    try {
        store.list({std::string("CSE"), std::nullopt, std::string("Maths")});
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Snapshot without subject covers every subject of the section
    assert(store.snapshot({"CSE", "A", std::nullopt}).size() == 2);
    assert(store.snapshot({"CSE", "A", std::string("Maths")}).size() == 1);

    std::cout << "  PASSED" << std::endl;
}

void testUpsertValidation() {
    std::cout << "Testing upsert validation and dimension pinning..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    store.upsert(identity("1", "CSE", "A"));

    auto expect_validation = [&](EnrolledIdentity id) {
        bool threw = false;
        try {
            store.upsert(id);
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
    };

    EnrolledIdentity bad = identity("x y", "CSE", "A");
    expect_validation(bad);
    bad = identity("2", "CSE", "A");
    bad.name = " ";
    expect_validation(bad);
    bad = identity("2", "", "A");
    expect_validation(bad);
    bad = identity("2", "CSE", "A");
    bad.embedding.clear();
    expect_validation(bad);

    EnrolledIdentity wrong_dim = identity("2", "CSE", "A");
    wrong_dim.embedding = axisVector(DIM + 2, 0);
    bool threw = false;
    try {
        store.upsert(wrong_dim);
    } catch (const DimensionMismatchError& e) {
        threw = true;
        assert(e.expected() == DIM && e.actual() == DIM + 2);
    }
    assert(threw);
    assert(store.count() == 1);

    std::cout << "  PASSED" << std::endl;
}

void testPersistence() {
    std::cout << "Testing data survives reopening..." << std::endl;

    TempDir dir("rollcall_store");
    {
        Database db(dir.file("store.db"));
        IdentityStore(db).upsert(identity("42", "CSE", "A", std::nullopt, 1));
    }
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    auto id = store.get("42");
    assert(id && id->embedding == axisVector(DIM, 1));
    assert(*store.dimension() == DIM);

    std::cout << "  PASSED" << std::endl;
}

void testLedgerRecord() {
    std::cout << "Testing ledger record / crops / dedup..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));

    store.upsert(identity("21045001", "CSE", "A"));
    store.upsert(identity("21045002", "CSE", "A"));

    Image photo(100, 80, 3);
    Scope scope{"CSE", "A", std::string("Maths")};
    SessionStamp stamp = fixedStamp("2024-03-18", "09:15:02.123", "20240318_091502_123");

    std::set<std::string> session;
    RecordReport report = ledger.record(scope, stamp,
        {assignment("21045001", 0.82f), assignment("21045002", 0.61f, 50)}, photo, &session);

    assert(report.recorded.size() == 2);
    assert(report.duplicates.empty());
    assert(session.count("21045001") && session.count("21045002"));

    const std::string expected_crop =
        dir.file("crops") + "/2024-03-18/CSE/A/Maths/21045001_Name 21045001_20240318_091502_123.jpg";
    assert(report.recorded[0].crop_path == expected_crop);
    assert(fileExists(expected_crop));
    assert(report.recorded[0].id > 0);

    // Same session again: both are duplicates, nothing new is written
    RecordReport again = ledger.record(scope, stamp, {assignment("21045001", 0.9f)}, photo, &session);
    assert(again.recorded.empty());
    assert(again.duplicates.size() == 1);

    auto records = ledger.list();
    assert(records.size() == 2);
    assert(records[0].subject && *records[0].subject == "Maths");
    assert(records[0].date == "2024-03-18" && records[0].time == "09:15:02.123");
    assert(ledger.countForIdentity("21045001") == 1);

    // A later session may mark the same person again
    SessionStamp later = fixedStamp("2024-03-19", "10:00:00.000", "20240319_100000_000");
    ledger.record({"CSE", "A", std::nullopt}, later, {assignment("21045001", 0.77f)}, photo);
    records = ledger.list();
    assert(records.size() == 3);
    assert(records[0].date == "2024-03-19");  // newest first
    assert(!records[0].subject);
    assert(fileExists(dir.file("crops") + "/2024-03-19/CSE/A/21045001_Name 21045001_20240319_100000_000.jpg"));

    assert(ledger.list({std::string("CSE"), std::string("A"), std::string("2024-03-18")}).size() == 2);
    assert(ledger.list({std::string("ECE"), std::nullopt, std::nullopt}).empty());

    std::cout << "  PASSED" << std::endl;
}

void testLedgerRejectsUnknownIdentity() {
    std::cout << "Testing ledger rollback for an unknown roll number..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));
    store.upsert(identity("1", "CSE", "A"));

    Image photo(64, 64, 3);
    SessionStamp stamp = fixedStamp("2024-03-18", "09:00:00.000", "20240318_090000_000");

    bool threw = false;
    try {
        ledger.record({"CSE", "A", std::nullopt}, stamp, {assignment("1", 0.9f), assignment("999", 0.8f, 30)}, photo);
    } catch (const StoreError&) {
        threw = true;
    }
    assert(threw);

    // Whole photo rolled back: no rows, no crops left behind
    assert(ledger.list().empty());
    assert(listDirectory(dir.file("crops") + "/2024-03-18/CSE/A").empty());

    // Region outside the photo
    threw = false;
    Assignment outside = assignment("1", 0.9f);
    outside.region = Rect(200, 200, 10, 10);
    try {
        ledger.record({"CSE", "A", std::nullopt}, stamp, {outside}, photo);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASSED" << std::endl;
}

void testDeleteIdentityCascades() {
    std::cout << "Testing identity deletion cascades to attendance..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));
    store.upsert(identity("1", "CSE", "A"));
    store.upsert(identity("2", "CSE", "A"));

    Image photo(64, 64, 3);
    ledger.record({"CSE", "A", std::nullopt}, fixedStamp("2024-03-18", "09:00:00.000", "a"),
                  {assignment("1", 0.9f), assignment("2", 0.8f, 30)}, photo);
    ledger.record({"CSE", "A", std::nullopt}, fixedStamp("2024-03-19", "09:00:00.000", "b"),
                  {assignment("1", 0.9f)}, photo);

    DeleteResult result = store.deleteIdentity("1");
    assert(result.status == DeleteStatus::Deleted);
    assert(result.identities_removed == 1);
    assert(result.records_removed == 2);
    assert(ledger.countForIdentity("1") == 0);
    assert(ledger.countForIdentity("2") == 1);
    assert(!store.get("1"));

    result = store.deleteIdentity("1");
    assert(result.status == DeleteStatus::NotFound);
    assert(result.identities_removed == 0);

    std::cout << "  PASSED" << std::endl;
}

void testDeleteScope() {
    std::cout << "Testing scope deletion (CSE/A vs CSE/B)..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));

    store.upsert(identity("A1", "CSE", "A"));
    store.upsert(identity("A2", "CSE", "A", std::string("Maths")));
    store.upsert(identity("B1", "CSE", "B"));

    Image photo(64, 64, 3);
    ledger.record({"CSE", "A", std::nullopt}, fixedStamp("2024-03-18", "09:00:00.000", "a"),
                  {assignment("A1", 0.9f), assignment("A2", 0.8f, 30)}, photo);
    ledger.record({"CSE", "B", std::nullopt}, fixedStamp("2024-03-18", "10:00:00.000", "b"),
                  {assignment("B1", 0.9f)}, photo);

    // Subject narrows to A2 only
    DeleteResult result = store.deleteScope("CSE", std::string("A"), std::string("Maths"));
    assert(result.status == DeleteStatus::Deleted);
    assert(result.identities_removed == 1);
    assert(store.get("A1"));

    result = store.deleteScope("CSE", std::string("A"), std::nullopt);
    assert(result.status == DeleteStatus::Deleted);
    assert(result.identities_removed == 1);
    assert(result.records_removed == 1);

    // CSE/B untouched
    assert(store.get("B1"));
    assert(ledger.countForIdentity("B1") == 1);
    assert(store.count() == 1);

    result = store.deleteScope("CSE", std::string("A"), std::nullopt);
    assert(result.status == DeleteStatus::NotFound);

    bool threw = false;
    try {
        store.deleteScope("CSE", std::nullopt, std::string("Maths"));
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);

    // Whole class
    result = store.deleteScope("CSE", std::nullopt, std::nullopt);
    assert(result.status == DeleteStatus::Deleted);
    assert(store.count() == 0);
    assert(ledger.list().empty());

    std::cout << "  PASSED" << std::endl;
}

void testReenrollmentKeepsHistory() {
    std::cout << "Testing re-enrollment keeps attendance history..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));

    store.upsert(identity("1", "CSE", "A"));
    Image photo(64, 64, 3);
    ledger.record({"CSE", "A", std::nullopt}, fixedStamp("2024-03-18", "09:00:00.000", "a"),
                  {assignment("1", 0.9f)}, photo);

    store.upsert(identity("1", "CSE", "A", std::nullopt, 3));
    assert(ledger.countForIdentity("1") == 1);
    assert(store.get("1")->embedding == axisVector(DIM, 3));

    std::cout << "  PASSED" << std::endl;
}

void testClear() {
    std::cout << "Testing clear..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));
    store.upsert(identity("1", "CSE", "A"));
    Image photo(64, 64, 3);
    ledger.record({"CSE", "A", std::nullopt}, fixedStamp("2024-03-18", "09:00:00.000", "a"),
                  {assignment("1", 0.9f)}, photo);

    DeleteResult result = store.clear();
    assert(result.identities_removed == 1);
    assert(result.records_removed == 1);
    assert(store.count() == 0);
    assert(!store.dimension());

    // Dimension is free again after a reset
    EnrolledIdentity wider = identity("2", "CSE", "A");
    wider.embedding = axisVector(DIM * 2, 0);
    store.upsert(wider);
    assert(*store.dimension() == DIM * 2);

    std::cout << "  PASSED" << std::endl;
}

void testEncodingBlob() {
    std::cout << "Testing embedding blob packing..." << std::endl;

    FaceEncoding v = {0.25f, -1.5f, 3.0f};
    std::vector<uint8_t> blob = packEncoding(v);
    assert(blob.size() == v.size() * sizeof(float));
    assert(unpackEncoding(blob) == v);

    std::cout << "  PASSED" << std::endl;
}

void testCropNameKeepsDisplayName() {
    std::cout << "Testing crop names keep the display name as given..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);
    AttendanceLedger ledger(db, dir.file("crops"));
    store.upsert(identity("21045001", "CSE", "A"));
    store.upsert(identity("21045002", "CSE", "A"));

    Image photo(100, 80, 3);
    Scope scope{"CSE", "A", std::nullopt};
    SessionStamp stamp = fixedStamp("2024-03-18", "09:15:02.123", "20240318_091502_123");

    Assignment spaced = assignment("21045001", 0.9f);
    spaced.name = "aman meena";
    Assignment accented = assignment("21045002", 0.8f, 50);
    accented.name = "Zo\xc3\xab O'Neil";

    RecordReport report = ledger.record(scope, stamp, {spaced, accented}, photo);
    assert(report.recorded.size() == 2);

    const std::string base = dir.file("crops") + "/2024-03-18/CSE/A/";
    assert(report.recorded[0].crop_path == base + "21045001_aman meena_20240318_091502_123.jpg");
    assert(report.recorded[1].crop_path == base + "21045002_Zo\xc3\xab O'Neil_20240318_091502_123.jpg");
    assert(fileExists(report.recorded[0].crop_path));
    assert(fileExists(report.recorded[1].crop_path));

    // A name that would leave the crop directory is refused, nothing is written
    Assignment escaping = assignment("21045001", 0.9f);
    escaping.name = "../../etc";
    SessionStamp later = fixedStamp("2024-03-19", "09:00:00.000", "20240319_090000_000");
    bool threw = false;
    try {
        ledger.record(scope, later, {escaping}, photo);
    } catch (const ValidationError&) {
        threw = true;
    }
    assert(threw);
    assert(!isDirectory(dir.file("crops") + "/2024-03-19"));
    assert(ledger.list().size() == 2);

    std::cout << "  PASSED" << std::endl;
}

void testConcurrentUpsertAndSnapshot() {
    std::cout << "Testing concurrent upserts against snapshot readers..." << std::endl;

    TempDir dir("rollcall_store");
    Database db(dir.file("store.db"));
    IdentityStore store(db);

    constexpr int WRITERS = 6;
    constexpr int PER_WRITER = 15;

    std::atomic<int> writers_left{WRITERS};
    std::atomic<bool> bad_row{false};
    std::atomic<bool> shrank{false};
    std::atomic<int> snapshots{0};

    std::thread reader([&]() {
        size_t last = 0;
        while (writers_left.load() > 0) {
            std::vector<EnrolledIdentity> rows = store.snapshot({"CSE", "A", std::nullopt});
            if (rows.size() < last) {
                shrank = true;
            }
            last = rows.size();
            for (const auto& row : rows) {
                if (row.embedding.size() != DIM || row.sample_count != 3 ||
                    row.name != "Name " + row.roll_no || row.enrolled_at.empty()) {
                    bad_row = true;
                }
            }
            snapshots++;
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < WRITERS; w++) {
        writers.emplace_back([&, w]() {
            for (int i = 0; i < PER_WRITER; i++) {
                std::string roll = "W" + std::to_string(w) + "-" + std::to_string(i);
                store.upsert(identity(roll, "CSE", "A", std::nullopt, static_cast<size_t>(i)));
            }
            writers_left--;
        });
    }

    for (auto& t : writers) {
        t.join();
    }
    reader.join();

    assert(store.count() == static_cast<size_t>(WRITERS * PER_WRITER));
    assert(*store.dimension() == DIM);
    assert(store.snapshot({"CSE", "A", std::nullopt}).size() == static_cast<size_t>(WRITERS * PER_WRITER));
    assert(!bad_row.load());
    assert(!shrank.load());
    assert(snapshots.load() > 0);

    std::cout << "  PASSED" << std::endl;
}

int main() {
    std::cout << "\n=== Store Tests ===" << std::endl;

    testUpsertAndGet();
    testUpsertValidation();
    testPersistence();
    testLedgerRecord();
    testLedgerRejectsUnknownIdentity();
    testCropNameKeepsDisplayName();
    testDeleteIdentityCascades();
    testDeleteScope();
    testReenrollmentKeepsHistory();
    testClear();
    testEncodingBlob();
    testConcurrentUpsertAndSnapshot();

    std::cout << "\n=== All Tests Passed ===" << std::endl;
    return 0;
}
