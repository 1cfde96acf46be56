#ifndef ROLLCALL_ATTENDANCE_LEDGER_H
#define ROLLCALL_ATTENDANCE_LEDGER_H

#include "database.h"
#include "../identity.h"
#include "../image.h"
#include "../matching.h"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace rollcall {

// Local wall-clock instant shared by every record of one marking session
struct SessionStamp {
    std::string date;       // YYYY-MM-DD
    std::string time;       // HH:MM:SS.mmm
    std::string timestamp;  // YYYYMMDD_HHMMSS_mmm, used in crop file names

    static SessionStamp now();
};

struct AttendanceRecord {
    int64_t id = 0;
    std::string roll_no;
    std::string name;
    std::string class_name;
    std::string section;
    std::optional<std::string> subject;
    double similarity = 0.0;
    std::string date;
    std::string time;
    std::string crop_path;
};

struct AttendanceFilter {
    std::optional<std::string> class_name;
    std::optional<std::string> section;
    std::optional<std::string> date;  // YYYY-MM-DD
};

struct RecordReport {
    std::vector<AttendanceRecord> recorded;
    std::vector<std::string> duplicates;  // roll numbers already marked in this session
};

/**
 * Append-only attendance log with face crops on disk.
 *
 * Crops go to {crops_dir}/{date}/{class}/{section}[/{subject}]/{roll_no}_{name}_{timestamp}.jpg
 */
class AttendanceLedger {
public:
    AttendanceLedger(Database& db, const std::string& crops_dir) : db_(db), crops_dir_(crops_dir) {}

    /**
     * Record one photo's assignments in a single transaction.
     *
     * A roll number is written at most once per call; passing the session's
     * `session_marked` set extends that to the whole session and is updated
     * only after the transaction commits. On failure every crop written by the
     * call is removed again and the exception propagates.
     *
     * @throws ValidationError for an invalid scope, a region outside the photo, or a name
     *         containing '/' or NUL (names are written into the crop file name as given)
     * @throws StoreError when a crop cannot be written or the database refuses the rows
     */
    RecordReport record(const Scope& scope, const SessionStamp& stamp,
                        const std::vector<Assignment>& assignments, const Image& photo,
                        std::set<std::string>* session_marked = nullptr);

    // Newest first. Section requires class.
    std::vector<AttendanceRecord> list(const AttendanceFilter& filter = {});

    size_t countForIdentity(const std::string& roll_no);

    // Directory a crop for this scope and stamp is written to
    std::string cropDirectory(const Scope& scope, const SessionStamp& stamp) const;

    const std::string& cropsDir() const { return crops_dir_; }

private:
    Database& db_;
    std::string crops_dir_;
};

} // namespace rollcall

#endif // ROLLCALL_ATTENDANCE_LEDGER_H
