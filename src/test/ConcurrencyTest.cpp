#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/AsyncTaskManager.hpp"
#include "application/VerificationService.hpp"
#include "TestSupport.hpp"

using namespace sourceproof;

namespace {

// Chain reader with network-like latency.
class SlowChainReader : public test::FakeChainReader {
public:
    domain::CodeReadResult getCode(const std::string& address) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return test::FakeChainReader::getCode(address);
    }
};

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const std::string address = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";
    const std::string other = "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359";
    const std::string source = "pragma solidity ^0.6.0;\ncontract A {}\n";

    // Setup
    auto reader = std::make_shared<SlowChainReader>();
    reader->deploy(address, test::DeployedCode(0x11));
    domain::ChainRegistry::ReaderMap readers;
    readers["1"] = reader;
    auto registry = std::make_shared<const domain::ChainRegistry>(readers);
    auto compiler = std::make_shared<test::FakeCompiler>(test::kRuntimePrefix + test::IpfsTrailer(0x11));
    auto repository = std::make_shared<test::InMemoryRepository>();
    application::VerificationService service(registry, compiler, repository);

    domain::InputData input;
    input.repository = "repo";
    input.chain = "1";
    input.addresses = {address};
    input.files = {
        {"A.sol", source},
        {"metadata.json", test::MakeMetadata("A.sol", "A", {{"A.sol", source}}).dump()},
    };

    // Identical submissions race on the same repository paths; failing ones run beside them.
    const int NUM_SUBMISSIONS = 24;
    std::vector<std::shared_ptr<application::TaskStatus>> tasks;
    {
        application::AsyncTaskManager taskManager;
        std::cout << "[Test] Submitting " << NUM_SUBMISSIONS << " verifications..." << std::endl;
        for (int i = 0; i < NUM_SUBMISSIONS; ++i) {
            domain::InputData submission = input;
            if (i % 4 == 3) {
                submission.addresses = {other};
            }
            tasks.push_back(taskManager.SubmitTask("Submission " + std::to_string(i),
                [&service, submission](std::shared_ptr<application::TaskStatus>) {
                    return service.inject(submission);
                }));
        }
        taskManager.WaitAll();
        assert(taskManager.GetActiveTasks().empty());
    }

    int perfect = 0;
    int failed = 0;
    for (const auto& task : tasks) {
        assert(task->isCompleted);
        if (task->failed) {
            ++failed;
            assert(task->errorMessage.find(other) != std::string::npos);
        } else {
            assert(task->match && task->match->status == domain::MatchStatus::Perfect);
            ++perfect;
        }
    }
    assert(perfect == 18);
    assert(failed == 6);
    assert(compiler->calls == NUM_SUBMISSIONS);
    std::cout << "[PASS] " << perfect << " matches, " << failed << " isolated failures." << std::endl;

    // Last writer wins, and every writer wrote the same bytes.
    assert(repository->size() == 3);
    assert(repository->files.at("repo/contracts/full_match/1/" + address + "/sources/A.sol") == source);
    std::cout << "[PASS] Repository holds one consistent copy." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
