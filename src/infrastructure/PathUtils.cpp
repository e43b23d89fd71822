#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace sourceproof::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path ResolveBaseDir(const char* xdgVariable, const fs::path& homeRelative) {
    const char* xdg = std::getenv(xdgVariable);
    if (xdg && *xdg) {
        return fs::path(xdg);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return ResolveBaseDir("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return ResolveBaseDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetCompilerDir() {
    return GetDataHome() / "sourceproof" / "solc";
}

} // namespace sourceproof::infrastructure
