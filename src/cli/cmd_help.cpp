#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace rollcall {

void print_usage() {
    std::cout << "rollcall - Face enrollment and attendance marking" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: rollcall <command> [options]" << std::endl << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  enroll --class C --section S [--subject J] <dir>      Enroll one sub-folder per person (<roll>_<name>)" << std::endl;
    std::cout << "  mark --class C --section S [--subject J] [--threshold T] <photo|dir>..." << std::endl;
    std::cout << "                                                        Mark attendance from group photos" << std::endl;
    std::cout << "  remove <roll_no>                                      Remove an identity and its attendance" << std::endl;
    std::cout << "  remove-class --class C [--section S] [--subject J]    Remove every identity in a scope" << std::endl;
    std::cout << "  list [--class C [--section S [--subject J]]]          List enrolled identities" << std::endl;
    std::cout << "  attendance [--class C [--section S]] [--date D]       List attendance records" << std::endl;
    std::cout << "  reset --yes                                           Drop all identities and attendance" << std::endl;
    std::cout << "  version                                               Show version information" << std::endl;
    std::cout << "  help                                                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Common options:" << std::endl;
    std::cout << "  --config PATH    Configuration file (default: " << CONFIG_DIR << "/rollcall.conf)" << std::endl;
    std::cout << "  --json           Machine-readable output" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  rollcall enroll --class CSE --section A ./dataset          # ./dataset/21045001_aman_meena/*.jpg" << std::endl;
    std::cout << "  rollcall mark --class CSE --section A class_photo.jpg       # Mark with the configured threshold" << std::endl;
    std::cout << "  rollcall mark --class CSE --section A --threshold 0.4 ./photos" << std::endl;
    std::cout << "  rollcall attendance --class CSE --section A --date 2024-03-18" << std::endl;
    std::cout << "  rollcall remove 21045001                                    # Also removes attendance rows" << std::endl;
    std::cout << "  rollcall remove-class --class CSE --section A" << std::endl;
}

} // namespace rollcall
