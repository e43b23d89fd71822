/**
 * @file SourceProofApp.hpp
 * @brief Command-line front end for the verification pipeline.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace sourceproof::app {

/**
 * @struct CliOptions
 * @brief Parsed command line.
 */
struct CliOptions {
    std::string chain;
    std::vector<std::string> addresses;
    std::vector<std::string> inputs;      ///< Files or directories.
    std::optional<std::string> repository;
    std::optional<std::string> configPath;
    std::optional<std::string> bytecode;
    std::optional<std::string> layout;
    bool batch = false;
};

/**
 * @class SourceProofApp
 * @brief Composition root: loads settings, wires services and runs submissions.
 *
 * Exit codes: 0 when every submission matched, 1 on a verification failure,
 * 2 on a usage or configuration error.
 */
class SourceProofApp {
public:
    /**
     * @brief Parses arguments and runs the requested verification(s).
     * @return Process exit code.
     */
    int Run(int argc, char** argv);

    /** @brief Parses argv; std::nullopt on a usage error (already reported). */
    static std::optional<CliOptions> ParseArguments(const std::vector<std::string>& args);

private:
    bool Init(const CliOptions& options);
    int RunSingle(const CliOptions& options);
    int RunBatch(const CliOptions& options);
    domain::InputData MakeInput(const CliOptions& options, std::vector<domain::RawFile> files) const;
    static void PrintUsage();

    infrastructure::VerifierConfig m_config;
    application::AppServices m_services;
};

} // namespace sourceproof::app
