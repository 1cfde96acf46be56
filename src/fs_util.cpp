#include "fs_util.h"
#include <algorithm>
#include <cerrno>
#include <dirent.h>
#include <sys/stat.h>

namespace rollcall {

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool makeDirectories(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (isDirectory(path)) {
        return true;
    }

    size_t pos = 0;
    do {
        pos = path.find('/', pos + 1);
        std::string partial = path.substr(0, pos);
        if (partial.empty() || isDirectory(partial)) {
            continue;
        }
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    } while (pos != std::string::npos);

    return isDirectory(path);
}

std::vector<std::string> listDirectory(const std::string& path) {
    std::vector<std::string> entries;

    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return entries;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }
        entries.push_back(name);
    }
    closedir(dir);

    std::sort(entries.begin(), entries.end());
    return entries;
}

std::string joinPath(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (a.back() == '/') return a + b;
    return a + "/" + b;
}

std::string baseName(const std::string& path) {
    size_t end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return path.empty() ? "" : "/";
    }
    size_t slash = path.rfind('/', end);
    size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    return path.substr(start, end - start + 1);
}

} // namespace rollcall
