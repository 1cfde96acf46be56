#include "attendance_ledger.h"
#include "../errors.h"
#include "../fs_util.h"
#include "../image_io.h"
#include "../logger.h"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rollcall {

SessionStamp SessionStamp::now() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    SessionStamp stamp;
    std::stringstream ss;

    ss << std::put_time(&tm_buf, "%Y-%m-%d");
    stamp.date = ss.str();

    ss.str("");
    ss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    stamp.time = ss.str();

    ss.str("");
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S") << '_' << std::setfill('0') << std::setw(3) << ms.count();
    stamp.timestamp = ss.str();

    return stamp;
}

std::string AttendanceLedger::cropDirectory(const Scope& scope, const SessionStamp& stamp) const {
    std::string dir = joinPath(crops_dir_, stamp.date);
    dir = joinPath(dir, scope.class_name);
    dir = joinPath(dir, scope.section);
    if (scope.subject) {
        dir = joinPath(dir, *scope.subject);
    }
    return dir;
}

RecordReport AttendanceLedger::record(const Scope& scope, const SessionStamp& stamp,
                                      const std::vector<Assignment>& assignments, const Image& photo,
                                      std::set<std::string>* session_marked) {
    validateScope(scope);

    RecordReport report;
    std::set<std::string> marked_now;

    // Pick the assignments to write and cut their crops before touching disk
    std::vector<const Assignment*> pending;
    std::vector<Image> crops;
    for (const auto& a : assignments) {
        bool seen = marked_now.count(a.roll_no) > 0 ||
                    (session_marked != nullptr && session_marked->count(a.roll_no) > 0);
        if (seen) {
            report.duplicates.push_back(a.roll_no);
            continue;
        }

        if (a.name.empty() || a.name.find('/') != std::string::npos ||
            a.name.find('\0') != std::string::npos) {
            throw ValidationError("name of " + a.roll_no + " cannot be used in a crop file name");
        }

        Image crop = photo.crop(a.region);
        if (crop.empty()) {
            throw ValidationError("face region of " + a.roll_no + " lies outside the photo");
        }
        marked_now.insert(a.roll_no);
        pending.push_back(&a);
        crops.push_back(std::move(crop));
    }

    if (pending.empty()) {
        return report;
    }

    const std::string dir = cropDirectory(scope, stamp);
    if (!makeDirectories(dir)) {
        throw StoreError("cannot create crop directory " + dir);
    }

    std::vector<std::string> written;
    auto remove_written = [&written]() {
        for (const auto& path : written) {
            if (std::remove(path.c_str()) != 0) {
                Logger::getInstance().warning("Could not remove crop " + path);
            }
        }
    };

    try {
        for (size_t i = 0; i < pending.size(); i++) {
            const Assignment& a = *pending[i];
            // One stamp per session: unique only because a roll number is recorded once per session
            std::string filename = a.roll_no + "_" + a.name + "_" + stamp.timestamp + ".jpg";
            std::string path = joinPath(dir, filename);
            if (!writeJpeg(path, crops[i])) {
                throw StoreError("cannot write crop " + path);
            }
            written.push_back(path);

            AttendanceRecord rec;
            rec.roll_no = a.roll_no;
            rec.name = a.name;
            rec.class_name = scope.class_name;
            rec.section = scope.section;
            rec.subject = scope.subject;
            rec.similarity = a.similarity;
            rec.date = stamp.date;
            rec.time = stamp.time;
            rec.crop_path = path;
            report.recorded.push_back(std::move(rec));
        }

        auto lock = db_.writeLock();
        Transaction txn(db_);

        Statement stmt(db_,
            "INSERT INTO attendance(roll_no, name, class_name, section, subject, similarity, date, time, crop_path) "
            "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?);");
        for (auto& rec : report.recorded) {
            stmt.reset();
            stmt.bind(1, rec.roll_no)
                .bind(2, rec.name)
                .bind(3, rec.class_name)
                .bind(4, rec.section)
                .bind(5, rec.subject)
                .bind(6, rec.similarity)
                .bind(7, rec.date)
                .bind(8, rec.time)
                .bind(9, rec.crop_path);
            stmt.run();
            rec.id = sqlite3_last_insert_rowid(db_.handle());
        }

        txn.commit();
    } catch (const std::exception&) {
        remove_written();
        throw;
    }

    if (session_marked != nullptr) {
        session_marked->insert(marked_now.begin(), marked_now.end());
    }

    for (const auto& rec : report.recorded) {
        Logger::getInstance().auditAttendance(scope.toString(), rec.roll_no,
                                              static_cast<float>(rec.similarity), rec.crop_path);
    }
    return report;
}

std::vector<AttendanceRecord> AttendanceLedger::list(const AttendanceFilter& filter) {
    if (filter.section && !filter.class_name) {
        throw ValidationError("section filter requires a class");
    }

    std::string sql = "SELECT id, roll_no, name, class_name, section, subject, similarity, date, time, crop_path "
                      "FROM attendance";
    std::vector<std::string> conditions;
    if (filter.class_name) conditions.push_back("class_name = ?");
    if (filter.section) conditions.push_back("section = ?");
    if (filter.date) conditions.push_back("date = ?");
    for (size_t i = 0; i < conditions.size(); i++) {
        sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
    }
    sql += " ORDER BY date DESC, time DESC, id DESC;";

    auto lock = db_.readLock();
    Statement stmt(db_, sql);
    int index = 1;
    if (filter.class_name) stmt.bind(index++, *filter.class_name);
    if (filter.section) stmt.bind(index++, *filter.section);
    if (filter.date) stmt.bind(index++, *filter.date);

    std::vector<AttendanceRecord> records;
    while (stmt.step()) {
        AttendanceRecord rec;
        rec.id = stmt.columnInt(0);
        rec.roll_no = stmt.columnText(1);
        rec.name = stmt.columnText(2);
        rec.class_name = stmt.columnText(3);
        rec.section = stmt.columnText(4);
        rec.subject = stmt.columnOptionalText(5);
        rec.similarity = stmt.columnDouble(6);
        rec.date = stmt.columnText(7);
        rec.time = stmt.columnText(8);
        rec.crop_path = stmt.columnText(9);
        records.push_back(std::move(rec));
    }
    return records;
}

size_t AttendanceLedger::countForIdentity(const std::string& roll_no) {
    auto lock = db_.readLock();
    Statement stmt(db_, "SELECT COUNT(*) FROM attendance WHERE roll_no = ?;");
    stmt.bind(1, roll_no);
    stmt.step();
    return static_cast<size_t>(stmt.columnInt(0));
}

} // namespace rollcall
