#include "commands.h"
#include "cli_common.h"
#include "../store/database.h"
#include "../store/identity_store.h"

namespace rollcall {

using namespace rollcall::cli;

namespace {

int printDeleteResult(const CommandArgs& args, const std::string& target, const DeleteResult& result) {
    const bool found = result.status == DeleteStatus::Deleted;

    if (args.has("json")) {
        printJson({{"target", target},
                   {"status", found ? "Deleted" : "NotFound"},
                   {"identities_removed", result.identities_removed},
                   {"records_removed", result.records_removed}});
    } else if (found) {
        std::cout << "✓ Removed " << target << ": " << result.identities_removed << " identity(ies), "
                  << result.records_removed << " attendance record(s)" << std::endl;
    } else {
        std::cerr << "✗ NotFound: nothing enrolled for " << target << std::endl;
    }
    return found ? 0 : 1;
}

} // namespace

int cmd_remove(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (args.positional.size() != 1) {
        std::cerr << "Error: roll number required" << std::endl;
        std::cerr << "Usage: rollcall remove <roll_no>" << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    const std::string& roll_no = args.positional[0];
    try {
        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);
        return printDeleteResult(args, roll_no, store.deleteIdentity(roll_no));
    } catch (const Error& e) {
        return reportFailure("remove", e);
    }
}

int cmd_remove_class(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {"class", "section", "subject"}, {}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }

    auto class_name = args.get("class");
    auto section = args.get("section");
    auto subject = args.get("subject");
    if (!class_name) {
        std::cerr << "Error: --class required" << std::endl;
        std::cerr << "Usage: rollcall remove-class --class C [--section S] [--subject J]" << std::endl;
        return 1;
    }
    if (subject && !section) {
        std::cerr << "Error: --subject requires --section" << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    IdentityFilter target{class_name, section, subject};
    try {
        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);
        return printDeleteResult(args, target.toString(), store.deleteScope(*class_name, section, subject));
    } catch (const Error& e) {
        return reportFailure("remove-class", e);
    }
}

} // namespace rollcall
