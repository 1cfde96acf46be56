#include "commands.h"
#include "cli_common.h"
#include "../store/attendance_ledger.h"
#include "../store/database.h"
#include "../store/identity_store.h"
#include <iomanip>

namespace rollcall {

using namespace rollcall::cli;

int cmd_list(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {"class", "section", "subject"}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    IdentityFilter filter{args.get("class"), args.get("section"), args.get("subject")};
    try {
        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);
        std::vector<EnrolledIdentity> identities = store.list(filter);

        if (args.has("json")) {
            nlohmann::json doc = nlohmann::json::array();
            for (const auto& id : identities) {
                doc.push_back({{"roll_no", id.roll_no},
                               {"name", id.name},
                               {"class_name", id.class_name},
                               {"section", id.section},
                               {"subject", id.subject ? nlohmann::json(*id.subject) : nlohmann::json()},
                               {"sample_count", id.sample_count},
                               {"enrolled_at", id.enrolled_at}});
            }
            printJson(doc);
            return 0;
        }

        std::cout << "Enrolled identities (" << filter.toString() << "):" << std::endl;
        if (identities.empty()) {
            std::cout << "  (none)" << std::endl;
        }
        for (const auto& id : identities) {
            std::cout << "  " << std::left << std::setw(14) << id.roll_no << " " << std::setw(24) << id.name
                      << " " << id.class_name << "/" << id.section;
            if (id.subject) {
                std::cout << "/" << *id.subject;
            }
            std::cout << " (" << id.sample_count << " samples, enrolled: " << id.enrolled_at << ")" << std::endl;
        }
        std::cout << "Total: " << identities.size() << " identity(ies)" << std::endl;
        return 0;
    } catch (const Error& e) {
        return reportFailure("list", e);
    }
}

int cmd_attendance(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {"class", "section", "date"}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    AttendanceFilter filter{args.get("class"), args.get("section"), args.get("date")};
    try {
        Database db(settings.database_path, settings.busy_timeout_ms);
        AttendanceLedger ledger(db, settings.crops_dir);
        std::vector<AttendanceRecord> records = ledger.list(filter);

        if (args.has("json")) {
            nlohmann::json doc = nlohmann::json::array();
            for (const auto& r : records) {
                doc.push_back({{"id", r.id},
                               {"roll_no", r.roll_no},
                               {"name", r.name},
                               {"class_name", r.class_name},
                               {"section", r.section},
                               {"subject", r.subject ? nlohmann::json(*r.subject) : nlohmann::json()},
                               {"similarity", r.similarity},
                               {"date", r.date},
                               {"time", r.time},
                               {"crop_path", r.crop_path}});
            }
            printJson(doc);
            return 0;
        }

        std::cout << "Attendance records:" << std::endl;
        if (records.empty()) {
            std::cout << "  (none)" << std::endl;
        }
        for (const auto& r : records) {
            std::cout << "  " << r.date << " " << r.time << "  " << std::left << std::setw(14) << r.roll_no
                      << " " << std::setw(24) << r.name << " " << r.class_name << "/" << r.section;
            if (r.subject) {
                std::cout << "/" << *r.subject;
            }
            std::cout << "  " << std::fixed << std::setprecision(3) << r.similarity << std::endl;
        }
        std::cout << "Total: " << records.size() << " record(s)" << std::endl;
        return 0;
    } catch (const Error& e) {
        return reportFailure("attendance", e);
    }
}

} // namespace rollcall
