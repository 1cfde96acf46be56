#include <iostream>
#include <string>
#include <vector>
#include "commands.h"
#include "config_paths.h"

using namespace rollcall;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "rollcall version " << VERSION << std::endl;
        return 0;
    }

    if (command == "enroll") {
        return cmd_enroll(args);
    }

    if (command == "mark") {
        return cmd_mark(args);
    }

    if (command == "remove") {
        return cmd_remove(args);
    }

    if (command == "remove-class") {
        return cmd_remove_class(args);
    }

    if (command == "list") {
        return cmd_list(args);
    }

    if (command == "attendance") {
        return cmd_attendance(args);
    }

    if (command == "reset") {
        return cmd_reset(args);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
