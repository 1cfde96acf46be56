#include "attendance_service.h"
#include "image_io.h"
#include "logger.h"
#include <set>

namespace rollcall {

MarkReport AttendanceService::mark(const Scope& scope,
                                   const std::vector<EncodedImage>& photos,
                                   const std::vector<std::string>& photo_paths,
                                   double threshold,
                                   const std::atomic<bool>* cancel) {
    validateScope(scope);
    validateThreshold(threshold);

    auto& logger = Logger::getInstance();
    const SessionStamp stamp = SessionStamp::now();
    std::set<std::string> session_marked;

    MarkReport report;
    report.date = stamp.date;
    report.time = stamp.time;

    const size_t total = photos.size() + photo_paths.size();
    for (size_t i = 0; i < total; i++) {
        EncodedImage loaded;
        const EncodedImage* photo = nullptr;
        if (i < photos.size()) {
            photo = &photos[i];
        } else {
            loaded.name = photo_paths[i - photos.size()];
            photo = &loaded;
        }

        if (cancel != nullptr && cancel->load()) {
            report.failed.push_back({photo->name, ErrorKind::Cancelled, "marking cancelled"});
            continue;
        }

        try {
            if (photo == &loaded && !readFileBytes(loaded.name, loaded.bytes)) {
                throw ExtractionError("cannot read photo " + loaded.name);
            }

            std::vector<Assignment> assignments = engine_.match(scope, *photo, threshold, cancel);

            if (!assignments.empty()) {
                Image decoded;
                std::string decode_error;
                if (!decodeImage(photo->bytes, decoded, decode_error)) {
                    throw ExtractionError("cannot decode " + photo->name + ": " + decode_error);
                }

                RecordReport recorded = ledger_.record(scope, stamp, assignments, decoded, &session_marked);
                for (const auto& rec : recorded.recorded) {
                    report.marked.push_back({rec.roll_no, rec.name, static_cast<float>(rec.similarity),
                                             photo->name, rec.crop_path});
                }
                if (!recorded.duplicates.empty()) {
                    logger.debug(std::to_string(recorded.duplicates.size()) +
                                 " already-marked match(es) in " + photo->name);
                }
            }
            report.photos_processed++;
        } catch (const Error& e) {
            logger.error("Marking failed for photo " + photo->name + ": " + e.what());
            report.failed.push_back({photo->name, e.kind(), e.what()});
        } catch (const std::exception& e) {
            logger.error("Marking failed for photo " + photo->name + ": " + e.what());
            report.failed.push_back({photo->name, ErrorKind::ExtractionFailure, e.what()});
        }
    }

    logger.info("Marking " + scope.toString() + ": " + std::to_string(report.marked.size()) +
                " marked from " + std::to_string(report.photos_processed) + " photo(s), " +
                std::to_string(report.failed.size()) + " failed");
    return report;
}

} // namespace rollcall
