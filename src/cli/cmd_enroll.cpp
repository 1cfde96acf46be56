#include "commands.h"
#include "cli_common.h"
#include "../store/database.h"
#include "../store/identity_store.h"
#include <iomanip>

namespace rollcall {

using namespace rollcall::cli;

int cmd_enroll(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {"class", "section", "subject"}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (args.positional.size() != 1) {
        std::cerr << "Error: exactly one dataset directory required" << std::endl;
        std::cerr << "Usage: rollcall enroll --class C --section S [--subject J] <dir>" << std::endl;
        return 1;
    }

    Scope scope;
    if (!scopeFromArgs(args, scope, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    const std::string& dataset_dir = args.positional[0];
    if (!isDirectory(dataset_dir)) {
        std::cerr << "Error: not a directory: " << dataset_dir << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    try {
        validateScope(scope);

        std::vector<PersonFolder> folders = collectPersonFolders(dataset_dir);
        if (folders.empty()) {
            std::cerr << "Error: no person folders found in " << dataset_dir << std::endl;
            return 1;
        }

        std::unique_ptr<FaceDetector> detector;
        if (!loadDetector(settings, detector)) {
            return 1;
        }

        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);

        EnrollmentOptions options;
        options.workers = settings.workers;
        options.extraction_timeout = std::chrono::milliseconds(settings.extraction_timeout_ms);
        EnrollmentAggregator aggregator(*detector, store, options);

        installCancelHandler();
        Logger::getInstance().info("Enrolling " + std::to_string(folders.size()) + " folder(s) from " +
                                   dataset_dir + " into " + scope.toString());
        EnrollmentReport report = aggregator.enroll(scope, folders, &cancelFlag());

        if (args.has("json")) {
            nlohmann::json doc;
            doc["enrolled"] = nlohmann::json::array();
            for (const auto& e : report.enrolled) {
                doc["enrolled"].push_back({{"roll_no", e.roll_no},
                                           {"name", e.name},
                                           {"images_processed", e.images_processed}});
            }
            doc["skipped"] = nlohmann::json::array();
            for (const auto& s : report.skipped) {
                doc["skipped"].push_back({{"folder", s.folder},
                                          {"reason", errorKindName(s.reason)},
                                          {"detail", s.detail}});
            }
            printJson(doc);
        } else {
            std::cout << "Enrolled into " << scope.toString() << ":" << std::endl;
            if (report.enrolled.empty()) {
                std::cout << "  (none)" << std::endl;
            }
            for (const auto& e : report.enrolled) {
                std::cout << "  ✓ " << std::left << std::setw(14) << e.roll_no << " " << e.name
                          << " (" << e.images_processed << "/" << e.images_total << " images)" << std::endl;
            }
            if (!report.skipped.empty()) {
                std::cout << "Skipped:" << std::endl;
                for (const auto& s : report.skipped) {
                    std::cout << "  ✗ " << s.folder << ": " << errorKindName(s.reason)
                              << " (" << s.detail << ")" << std::endl;
                }
            }
            std::cout << "Total: " << report.enrolled.size() << " enrolled, "
                      << report.skipped.size() << " skipped" << std::endl;
        }
        return 0;
    } catch (const Error& e) {
        return reportFailure("enroll", e);
    }
}

} // namespace rollcall
