#include "identity.h"

namespace rollcall {

std::string Scope::toString() const {
    std::string s = class_name + "/" + section;
    if (subject) {
        s += "/" + *subject;
    }
    return s;
}

std::string trimWhitespace(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool isValidRollCode(const std::string& code) {
    if (code.empty()) {
        return false;
    }
    for (char c : code) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool parseLabel(const std::string& label, Identifier& out, ParseError& err) {
    size_t sep = label.find('_');
    if (sep == std::string::npos) {
        err = {ErrorKind::MissingSeparator, "label '" + label + "' has no '_' separator"};
        return false;
    }

    std::string roll_no = trimWhitespace(label.substr(0, sep));
    std::string name = trimWhitespace(label.substr(sep + 1));

    if (roll_no.empty()) {
        err = {ErrorKind::EmptyField, "label '" + label + "' has an empty roll code"};
        return false;
    }
    if (name.empty()) {
        err = {ErrorKind::EmptyField, "label '" + label + "' has an empty name"};
        return false;
    }
    if (!isValidRollCode(roll_no)) {
        err = {ErrorKind::InvalidRollCode,
               "roll code '" + roll_no + "' may only contain letters, digits, '_' and '-'"};
        return false;
    }

    out.roll_no = roll_no;
    out.name = name;
    return true;
}

void validateScope(const Scope& scope) {
    if (trimWhitespace(scope.class_name).empty()) {
        throw ValidationError("class name must not be empty");
    }
    if (trimWhitespace(scope.section).empty()) {
        throw ValidationError("section must not be empty");
    }
    if (scope.subject && trimWhitespace(*scope.subject).empty()) {
        throw ValidationError("subject must not be empty when given");
    }

    // Scope parts become crop directory names
    auto is_path_safe = [](const std::string& part) {
        return part.find('/') == std::string::npos && part != "." && part != "..";
    };
    if (!is_path_safe(scope.class_name) || !is_path_safe(scope.section) ||
        (scope.subject && !is_path_safe(*scope.subject))) {
        throw ValidationError("scope " + scope.toString() + " contains a path separator");
    }
}

} // namespace rollcall
