#include "infrastructure/SolcProcessCompiler.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace sourceproof::infrastructure {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long> g_invocation{0};

/// Removes the temporary exchange files however compile() exits.
struct TempFiles {
    fs::path input;
    fs::path output;

    ~TempFiles() {
        std::error_code ec;
        fs::remove(input, ec);
        fs::remove(output, ec);
    }
};

} // namespace

SolcProcessCompiler::SolcProcessCompiler(const std::string& defaultBinary,
                                         const std::string& compilerDirectory)
    : m_defaultBinary(defaultBinary)
    , m_compilerDirectory(compilerDirectory)
{}

std::string SolcProcessCompiler::resolveBinary(const std::string& version) const {
    if (!m_compilerDirectory.empty() && !version.empty()) {
        fs::path candidate = fs::path(m_compilerDirectory) / ("solc-v" + version);
        if (fs::exists(candidate)) {
            return candidate.string();
        }
    }
    return m_defaultBinary;
}

nlohmann::json SolcProcessCompiler::compile(const std::string& version, const nlohmann::json& standardInput) {
    const std::string binary = resolveBinary(version);

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string base = "sourceproof-" + std::to_string(stamp) + "-" + std::to_string(g_invocation++);
    TempFiles files{fs::temp_directory_path() / (base + "-input.json"),
                    fs::temp_directory_path() / (base + "-output.json")};

    {
        std::ofstream ofs(files.input);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open compiler input file: " + files.input.string());
        }
        ofs << standardInput.dump();
        if (ofs.fail()) {
            throw std::runtime_error("Failed to write compiler input file: " + files.input.string());
        }
    }

    // "solc" --standard-json < input > output
    std::stringstream cmd;
    cmd << "\"" << binary << "\" --standard-json < \"" << files.input.string()
        << "\" > \"" << files.output.string() << "\"";

    std::cout << "[SolcProcessCompiler] Running " << binary << " for version " << version << std::endl;

    int result = std::system(cmd.str().c_str());
    if (result != 0) {
        throw std::runtime_error("Compiler " + binary + " failed with code: " + std::to_string(result));
    }

    std::ifstream ifs(files.output);
    if (!ifs.is_open()) {
        throw std::runtime_error("Compiler output not found at: " + files.output.string());
    }

    try {
        nlohmann::json output;
        ifs >> output;
        return output;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Compiler produced unreadable output: ") + e.what());
    }
}

} // namespace sourceproof::infrastructure
