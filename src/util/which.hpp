#pragma once
#include <string>

namespace caserun::util {

// Equivalent of the which(1) utility. Names containing a '/' are checked
// as given. Returns an empty string when nothing executable is found.
std::string which(const std::string& cmd);

} // namespace caserun::util
