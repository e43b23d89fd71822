/**
 * @file Recompiler.cpp
 * @brief Implementation of Recompiler.
 */
#include "application/Recompiler.hpp"

#include <iostream>
#include <sstream>
#include "domain/VerificationErrors.hpp"

namespace sourceproof::application {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::string CollectFatalDiagnostics(const nlohmann::json& output) {
    std::ostringstream out;
    if (!output.contains("errors") || !output.at("errors").is_array()) {
        return {};
    }
    for (const auto& entry : output.at("errors")) {
        if (!entry.is_object() || entry.value("severity", "") != "error") continue;
        std::string text = entry.value("formattedMessage", "");
        if (text.empty()) text = entry.value("message", "unknown compiler error");
        out << Trim(text) << "\n";
    }
    return out.str();
}

} // namespace

Recompiler::Recompiler(domain::Compiler& compiler) : m_compiler(compiler) {}

domain::CompilationResult Recompiler::ExtractArtifacts(const nlohmann::json& output,
                                                       const domain::CompilationTarget& target) {
    const std::string diagnostics = CollectFatalDiagnostics(output);
    if (!diagnostics.empty()) {
        throw domain::CompilationError("Compilation failed:\n" + diagnostics, {"[RECOMPILE]", {}, {}});
    }

    const nlohmann::json* contract = nullptr;
    if (output.contains("contracts") && output.at("contracts").contains(target.fileName)
        && output.at("contracts").at(target.fileName).contains(target.contractName)) {
        contract = &output.at("contracts").at(target.fileName).at(target.contractName);
    }
    if (!contract) {
        throw domain::CompilationError(
            "Compiler output does not contain " + target.fileName + ":" + target.contractName,
            {"[RECOMPILE]", {}, {}});
    }

    try {
        domain::CompilationResult result;
        const nlohmann::json& evm = contract->at("evm");
        result.bytecode = evm.at("bytecode").at("object").get<std::string>();
        std::string deployed = evm.at("deployedBytecode").at("object").get<std::string>();
        result.deployedBytecode = deployed.rfind("0x", 0) == 0 ? deployed : "0x" + deployed;
        result.metadata = Trim(contract->at("metadata").get<std::string>());
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw domain::CompilationError(
            "Malformed compiler output for " + target.contractName + ": " + e.what(),
            {"[RECOMPILE]", {}, {}});
    }
}

domain::CompilationResult Recompiler::recompile(const domain::MetadataDescriptor& descriptor,
                                                const domain::SourceSet& sources) {
    CompilerInput compilerInput = m_builder.build(descriptor, sources);
    const std::string version = descriptor.compilerVersion();

    std::cout << "[Recompiler] [RECOMPILE] fileName=" << compilerInput.target.fileName
              << " contractName=" << compilerInput.target.contractName
              << " version=" << version << " Recompiling" << std::endl;

    nlohmann::json output;
    try {
        output = m_compiler.compile(version, compilerInput.input);
    } catch (const domain::VerificationError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[Recompiler] [RECOMPILE] " << e.what() << std::endl;
        throw domain::CompilationError(e.what(), {"[RECOMPILE]", {}, {}});
    }

    try {
        return ExtractArtifacts(output, compilerInput.target);
    } catch (const domain::CompilationError& e) {
        std::cerr << "[Recompiler] [RECOMPILE] " << e.what() << std::endl;
        throw;
    }
}

} // namespace sourceproof::application
