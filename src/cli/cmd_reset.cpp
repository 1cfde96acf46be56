#include "commands.h"
#include "cli_common.h"
#include "../store/database.h"
#include "../store/identity_store.h"

namespace rollcall {

using namespace rollcall::cli;

int cmd_reset(const std::vector<std::string>& raw_args) {
    CommandArgs args;
    std::string error;
    if (!parseCommandArgs(raw_args, {}, {"yes"}, args, error)) {
        std::cerr << "Error: " << error << std::endl;
        return 1;
    }
    if (!args.has("yes")) {
        std::cerr << "Error: reset drops every identity and attendance record; pass --yes to confirm" << std::endl;
        return 1;
    }

    Settings settings;
    if (!loadSettings(args, settings)) {
        return 1;
    }

    try {
        Database db(settings.database_path, settings.busy_timeout_ms);
        IdentityStore store(db);
        DeleteResult result = store.clear();

        if (args.has("json")) {
            printJson({{"identities_removed", result.identities_removed},
                       {"records_removed", result.records_removed}});
        } else {
            std::cout << "✓ Reset: removed " << result.identities_removed << " identity(ies) and "
                      << result.records_removed << " attendance record(s)" << std::endl;
            std::cout << "  Crop images under " << settings.crops_dir << " were left in place" << std::endl;
        }
        return 0;
    } catch (const Error& e) {
        return reportFailure("reset", e);
    }
}

} // namespace rollcall
