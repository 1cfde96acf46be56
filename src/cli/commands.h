#ifndef ROLLCALL_CLI_COMMANDS_H
#define ROLLCALL_CLI_COMMANDS_H

#include <string>
#include <vector>

namespace rollcall {

/**
 * Command Functions for the rollcall CLI
 *
 * Each command receives the arguments following its name and returns:
 *   - 0 on success
 *   - 1 on failure
 *
 * Every command accepts --config PATH and --json.
 */

/**
 * Enroll every person folder of a dataset directory
 *
 * rollcall enroll --class C --section S [--subject J] <dataset_dir>
 *
 * Returns 1 only for fatal errors (bad scope, dimension mismatch, store failure);
 * skipped folders are reported but do not fail the command.
 */
int cmd_enroll(const std::vector<std::string>& args);

/**
 * Mark attendance from one or more group photos (files or directories)
 *
 * rollcall mark --class C --section S [--subject J] [--threshold T] <photo|dir>...
 */
int cmd_mark(const std::vector<std::string>& args);

/**
 * Remove one identity and its attendance records
 *
 * rollcall remove <roll_no>
 *
 * @return 1 if the roll number is not enrolled
 */
int cmd_remove(const std::vector<std::string>& args);

/**
 * Remove every identity of a class, class/section or class/section/subject
 *
 * rollcall remove-class --class C [--section S] [--subject J]
 */
int cmd_remove_class(const std::vector<std::string>& args);

/**
 * List enrolled identities, optionally narrowed to a scope
 *
 * rollcall list [--class C [--section S [--subject J]]]
 */
int cmd_list(const std::vector<std::string>& args);

/**
 * List attendance records, newest first
 *
 * rollcall attendance [--class C [--section S]] [--date YYYY-MM-DD]
 */
int cmd_attendance(const std::vector<std::string>& args);

/**
 * Drop all identities and attendance records
 *
 * rollcall reset --yes
 */
int cmd_reset(const std::vector<std::string>& args);

/**
 * Print usage information and command help
 */
void print_usage();

} // namespace rollcall

#endif // ROLLCALL_CLI_COMMANDS_H
