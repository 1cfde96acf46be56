#include "commands.h"
#include "cli_common.h"
#include "../attendance_service.h"
#include "../matching.h"
#include "../store/attendance_ledger.h"
#include "../store/database.h"
#include "../store/identity_store.h"
#include <iomanip>
#include <stdexcept>

namespace rollcall {

using namespace rollcall::cli;

int cmd_mark(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {"class", "section", "subject", "threshold"}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (args.positional.empty()) {
        std::cerr << "Error: at least one photo or directory required" << std::endl;
        std::cerr << "Usage: rollcall mark --class C --section S [--subject J] [--threshold T] <photo|dir>..." << std::endl;
        return 1;
    }

    Scope scope;
    if (!scopeFromArgs(args, scope, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    double threshold = settings.threshold;
    if (auto value = args.get("threshold")) {
        try {
            size_t consumed = 0;
            threshold = std::stod(*value, &consumed);
            if (consumed != value->size()) {
                throw std::invalid_argument(*value);
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: invalid threshold: " << *value << std::endl;
            return 1;
        }
    }

    try {
        validateScope(scope);
        validateThreshold(threshold);

        std::vector<std::string> photos = collectPhotoPaths(args.positional);
        if (photos.empty()) {
            std::cerr << "Error: no photos found" << std::endl;
            return 1;
        }

        std::unique_ptr<FaceDetector> detector;
        if (!loadDetector(settings, detector)) {
            return 1;
        }

        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);
        AttendanceLedger ledger(db, settings.crops_dir);
        MatchingEngine engine(*detector, store, std::chrono::milliseconds(settings.extraction_timeout_ms));
        AttendanceService service(engine, ledger);

        installCancelHandler();
        MarkReport report = service.mark(scope, {}, photos, threshold, &cancelFlag());

        if (args.has("json")) {
            nlohmann::json doc;
            doc["date"] = report.date;
            doc["time"] = report.time;
            doc["photos_processed"] = report.photos_processed;
            doc["marked"] = nlohmann::json::array();
            for (const auto& m : report.marked) {
                doc["marked"].push_back({{"roll_no", m.roll_no},
                                         {"name", m.name},
                                         {"similarity", m.similarity},
                                         {"photo", m.photo},
                                         {"crop_path", m.crop_path}});
            }
            doc["failed"] = nlohmann::json::array();
            for (const auto& f : report.failed) {
                doc["failed"].push_back({{"photo", f.photo},
                                         {"reason", errorKindName(f.reason)},
                                         {"detail", f.detail}});
            }
            printJson(doc);
        } else {
            std::cout << "Attendance for " << scope.toString() << " on " << report.date
                      << " at " << report.time << ":" << std::endl;
            if (report.marked.empty()) {
                std::cout << "  (nobody recognized)" << std::endl;
            }
            for (const auto& m : report.marked) {
                std::cout << "  ✓ " << std::left << std::setw(14) << m.roll_no << " " << m.name
                          << " (similarity " << std::fixed << std::setprecision(3) << m.similarity << ")"
                          << std::endl;
            }
            for (const auto& f : report.failed) {
                std::cout << "  ✗ " << f.photo << ": " << errorKindName(f.reason)
                          << " (" << f.detail << ")" << std::endl;
            }
            std::cout << "Total: " << report.marked.size() << " marked from " << report.photos_processed
                      << "/" << photos.size() << " photo(s)" << std::endl;
        }

        // Every photo failing is a failed run; partial failures are reported above
        return (report.photos_processed == 0 && !report.failed.empty()) ? 1 : 0;
    } catch (const Error& e) {
        return reportFailure("mark", e);
    }
}

} // namespace rollcall
