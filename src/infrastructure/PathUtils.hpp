// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace sourceproof::infrastructure {

/// XDG base directories, falling back to $HOME and finally the working directory.
class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /// {data home}/sourceproof/solc, where per-release solc-v{version} binaries are kept.
    static std::filesystem::path GetCompilerDir();
};

} // namespace sourceproof::infrastructure
