/**
 * @file SourceProofApp.cpp
 * @brief Implementation of the SourceProofApp class.
 */

#include "app/SourceProofApp.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include "domain/VerificationErrors.hpp"
#include "infrastructure/FileRepository.hpp"
#include "infrastructure/JsonRpcChainReader.hpp"
#include "infrastructure/SolcProcessCompiler.hpp"
#include "infrastructure/UploadScanner.hpp"

namespace sourceproof::app {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitVerificationFailed = 1;
constexpr int kExitUsage = 2;

void ReportMatch(const domain::Match& match) {
    std::cout << domain::MatchStatusToString(match.status) << " "
              << match.address.value_or("") << std::endl;
}

void ReportError(const domain::VerificationError& e) {
    const auto& ctx = e.context();
    std::cerr << "[SourceProofApp] " << ctx.loc << " chain=" << ctx.chain;
    for (const auto& address : ctx.addresses) {
        std::cerr << " address=" << address;
    }
    std::cerr << " " << e.what() << std::endl;
}

} // namespace

void SourceProofApp::PrintUsage() {
    std::cerr << "Usage: sourceproof --chain <id> --address <addr> [--address <addr>...]\n"
              << "                   [--repository <dir>] [--config <settings.json>]\n"
              << "                   [--bytecode <hex>] [--layout current|legacy] [--batch]\n"
              << "                   <file-or-directory>..." << std::endl;
}

std::optional<CliOptions> SourceProofApp::ParseArguments(const std::vector<std::string>& args) {
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto takeValue = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                std::cerr << "[SourceProofApp] Missing value for " << arg << std::endl;
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--chain") {
            if (!takeValue(options.chain)) return std::nullopt;
        } else if (arg == "--address") {
            if (!takeValue(value)) return std::nullopt;
            options.addresses.push_back(value);
        } else if (arg == "--repository") {
            if (!takeValue(value)) return std::nullopt;
            options.repository = value;
        } else if (arg == "--config") {
            if (!takeValue(value)) return std::nullopt;
            options.configPath = value;
        } else if (arg == "--bytecode") {
            if (!takeValue(value)) return std::nullopt;
            options.bytecode = value;
        } else if (arg == "--layout") {
            if (!takeValue(value)) return std::nullopt;
            if (value != "current" && value != "legacy") {
                std::cerr << "[SourceProofApp] Unknown layout: " << value << std::endl;
                return std::nullopt;
            }
            options.layout = value;
        } else if (arg == "--batch") {
            options.batch = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "[SourceProofApp] Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.inputs.push_back(arg);
        }
    }

    if (options.inputs.empty()) {
        std::cerr << "[SourceProofApp] No input files given" << std::endl;
        return std::nullopt;
    }
    return options;
}

bool SourceProofApp::Init(const CliOptions& options) {
    std::string configPath = options.configPath.value_or(infrastructure::ConfigLoader::DefaultConfigPath());
    try {
        m_config = infrastructure::ConfigLoader::Load(configPath);
    } catch (const std::exception& e) {
        std::cerr << "[SourceProofApp] Failed to load " << configPath << ": " << e.what() << std::endl;
        return false;
    }
    if (options.repository) m_config.repository = *options.repository;
    if (options.layout) m_config.layout = *options.layout;

    // Dependency Injection / Composition Root
    domain::ChainRegistry::ReaderMap readers;
    for (const auto& chain : m_config.chains) {
        readers[chain.id] = std::make_shared<infrastructure::JsonRpcChainReader>(chain.rpc, m_config.readTimeoutSeconds);
    }
    auto registry = std::make_shared<const domain::ChainRegistry>(std::move(readers));

    auto compiler = std::make_shared<infrastructure::SolcProcessCompiler>(m_config.solcPath, m_config.solcDirectory);
    auto repository = std::make_shared<infrastructure::FileRepository>();

    m_services.chainRegistry = registry;
    m_services.verificationService = std::make_unique<application::VerificationService>(
        registry, compiler, repository, application::ParseStorageLayout(m_config.layout));
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();

    std::cout << "[SourceProofApp] " << registry->chains().size() << " chain(s) configured, repository "
              << m_config.repository << " (" << m_config.layout << " layout)" << std::endl;
    return true;
}

domain::InputData SourceProofApp::MakeInput(const CliOptions& options, std::vector<domain::RawFile> files) const {
    domain::InputData input;
    input.repository = m_config.repository;
    input.chain = options.chain;
    input.addresses = options.addresses;
    input.files = std::move(files);
    input.bytecode = options.bytecode;
    return input;
}

int SourceProofApp::RunSingle(const CliOptions& options) {
    infrastructure::UploadScanner scanner;
    std::vector<domain::RawFile> files;
    try {
        files = scanner.scan(options.inputs);
    } catch (const std::exception& e) {
        std::cerr << "[SourceProofApp] " << e.what() << std::endl;
        return kExitUsage;
    }

    try {
        ReportMatch(m_services.verificationService->inject(MakeInput(options, std::move(files))));
        return kExitSuccess;
    } catch (const domain::VerificationError& e) {
        ReportError(e);
    } catch (const std::exception& e) {
        std::cerr << "[SourceProofApp] " << e.what() << std::endl;
    }
    return kExitVerificationFailed;
}

int SourceProofApp::RunBatch(const CliOptions& options) {
    std::vector<std::shared_ptr<application::TaskStatus>> tasks;
    infrastructure::UploadScanner scanner;
    auto* service = m_services.verificationService.get();

    for (const auto& path : options.inputs) {
        std::vector<domain::RawFile> files;
        try {
            files = scanner.scan({path});
        } catch (const std::exception& e) {
            std::cerr << "[SourceProofApp] " << e.what() << std::endl;
            return kExitUsage;
        }

        auto input = MakeInput(options, std::move(files));
        tasks.push_back(m_services.taskManager->SubmitTask(
            path,
            [service, input](std::shared_ptr<application::TaskStatus>) {
                return service->inject(input);
            }));
    }

    m_services.taskManager->WaitAll();

    int exitCode = kExitSuccess;
    for (const auto& task : tasks) {
        if (task->failed) {
            std::cerr << "[SourceProofApp] " << task->description << ": " << task->errorMessage << std::endl;
            exitCode = kExitVerificationFailed;
        } else if (task->match) {
            std::cout << task->description << ": ";
            ReportMatch(*task->match);
        }
    }
    return exitCode;
}

int SourceProofApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = ParseArguments(args);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }
    if (!Init(*options)) {
        return kExitUsage;
    }
    return options->batch ? RunBatch(*options) : RunSingle(*options);
}

} // namespace sourceproof::app
