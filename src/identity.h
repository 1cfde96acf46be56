#ifndef ROLLCALL_IDENTITY_H
#define ROLLCALL_IDENTITY_H

#include "errors.h"
#include <string>
#include <optional>

namespace rollcall {

// Roll code + display name parsed from a "<rollcode>_<name...>" label
struct Identifier {
    std::string roll_no;
    std::string name;
};

struct ParseError {
    ErrorKind kind = ErrorKind::MissingSeparator;
    std::string detail;
};

// Class / section / optional subject an enrollment or marking session applies to
struct Scope {
    std::string class_name;
    std::string section;
    std::optional<std::string> subject;

    // "CSE/A" or "CSE/A/Maths"
    std::string toString() const;
};

/**
 * Parse a per-person folder label.
 *
 * Splits on the first underscore; both parts are whitespace-trimmed.
 *   "21045001_aman_meena" -> { "21045001", "aman_meena" }
 *
 * @return false with err.kind = MissingSeparator, EmptyField or InvalidRollCode
 */
bool parseLabel(const std::string& label, Identifier& out, ParseError& err);

// Non-empty and only [A-Za-z0-9_-]
bool isValidRollCode(const std::string& code);

std::string trimWhitespace(const std::string& str);

// Throws ValidationError for an empty class/section or an empty subject string
void validateScope(const Scope& scope);

} // namespace rollcall

#endif // ROLLCALL_IDENTITY_H
