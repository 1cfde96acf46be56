#ifndef ROLLCALL_ATTENDANCE_SERVICE_H
#define ROLLCALL_ATTENDANCE_SERVICE_H

#include "errors.h"
#include "matching.h"
#include "store/attendance_ledger.h"
#include <atomic>
#include <string>
#include <vector>

namespace rollcall {

struct MarkedEntry {
    std::string roll_no;
    std::string name;
    float similarity = 0.0f;
    std::string photo;
    std::string crop_path;
};

struct FailedPhoto {
    std::string photo;
    ErrorKind reason = ErrorKind::ExtractionFailure;
    std::string detail;
};

struct MarkReport {
    std::vector<MarkedEntry> marked;
    std::vector<FailedPhoto> failed;
    size_t photos_processed = 0;
    std::string date;
    std::string time;
};

/**
 * One marking session over a batch of photos.
 *
 * All photos share one timestamp and one set of already-marked roll numbers,
 * so a person seen in several photos is recorded once. A photo that fails is
 * reported and the session moves on to the next one.
 */
class AttendanceService {
public:
    AttendanceService(MatchingEngine& engine, AttendanceLedger& ledger)
        : engine_(engine), ledger_(ledger) {}

    /**
     * Photos may be in memory (`photos`) or on disk (`photo_paths`, read on demand).
     *
     * @throws ValidationError for an invalid scope or threshold
     */
    MarkReport mark(const Scope& scope,
                    const std::vector<EncodedImage>& photos,
                    const std::vector<std::string>& photo_paths,
                    double threshold = DEFAULT_MATCH_THRESHOLD,
                    const std::atomic<bool>* cancel = nullptr);

    MarkReport mark(const Scope& scope, const std::vector<EncodedImage>& photos,
                    double threshold = DEFAULT_MATCH_THRESHOLD,
                    const std::atomic<bool>* cancel = nullptr) {
        return mark(scope, photos, {}, threshold, cancel);
    }

private:
    MatchingEngine& engine_;
    AttendanceLedger& ledger_;
};

} // namespace rollcall

#endif // ROLLCALL_ATTENDANCE_SERVICE_H
