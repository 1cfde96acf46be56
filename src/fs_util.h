#ifndef ROLLCALL_FS_UTIL_H
#define ROLLCALL_FS_UTIL_H

#include <string>
#include <vector>

namespace rollcall {

bool fileExists(const std::string& path);
bool isDirectory(const std::string& path);

// mkdir -p with mode 0755; true if the directory exists afterwards
bool makeDirectories(const std::string& path);

// Entry names of a directory (no "." / ".."), sorted. Empty if unreadable.
std::vector<std::string> listDirectory(const std::string& path);

std::string joinPath(const std::string& a, const std::string& b);

// Last path component, ignoring trailing slashes
std::string baseName(const std::string& path);

} // namespace rollcall

#endif // ROLLCALL_FS_UTIL_H
