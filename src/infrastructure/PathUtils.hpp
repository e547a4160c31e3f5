// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace safetyreview::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetProjectsDir();
};

} // namespace safetyreview::infrastructure
