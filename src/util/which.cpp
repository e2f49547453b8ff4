#include "util/which.hpp"
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace caserun::util {

std::string which(const std::string& cmd) {
    if (cmd.empty()) {
        return "";
    }

    if (cmd.find('/') != std::string::npos) {
        return access(cmd.c_str(), X_OK) == 0 ? cmd : "";
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return "";
    }

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) continue;
        std::string fullpath = dir + "/" + cmd;
        if (access(fullpath.c_str(), X_OK) == 0) {
            return fullpath;
        }
    }

    return "";
}

} // namespace caserun::util
