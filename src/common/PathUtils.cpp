#include "common/PathUtils.h"

#include <system_error>

namespace sigscan {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe_path.empty()) {
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    const std::filesystem::path path(relative_path);
    if (path.is_absolute()) {
        return path;
    }

    // 작업 디렉토리에 이미 존재하면 우선 사용
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::absolute(path, ec);
    }
    return getExecutableDir() / path;
}

} // namespace utils
} // namespace sigscan
