#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#include "infrastructure/FileRepository.hpp"
#include "infrastructure/UploadScanner.hpp"

using namespace sourceproof::infrastructure;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting FileRepository Test..." << std::endl;

    const fs::path testRoot = "test_repository_root";
    fs::remove_all(testRoot);

    FileRepository repository;
    const std::string metadataPath = (testRoot / "contracts/full_match/1/0xabc/metadata.json").string();

    // Nested directories are created on demand.
    repository.write(metadataPath, "{\"first\":true}");
    assert(repository.read(metadataPath) == "{\"first\":true}");

    // Overwrite, byte-exact.
    const std::string binaryish = std::string("line1\r\nline2\0tail", 17);
    repository.write(metadataPath, binaryish);
    assert(repository.read(metadataPath) == binaryish);
    assert(repository.read((testRoot / "missing").string()).empty());
    std::cout << "[PASS] Write, overwrite and read back." << std::endl;

    // Concurrent writers of one path leave a complete file and no temp files.
    const std::string sharedPath = (testRoot / "ipfs/QmShared").string();
    std::vector<std::thread> writers;
    for (int i = 0; i < 16; ++i) {
        writers.emplace_back([&repository, &sharedPath, i]() {
            repository.write(sharedPath, std::string(4096, static_cast<char>('a' + i)));
        });
    }
    for (auto& t : writers) t.join();

    const std::string stored = repository.read(sharedPath);
    assert(stored.size() == 4096);
    assert(stored.find_first_not_of(stored[0]) == std::string::npos);
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(testRoot / "ipfs")) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);
    std::cout << "[PASS] Concurrent writes are atomic." << std::endl;

    // Writing below a regular file fails loudly.
    bool thrown = false;
    try {
        repository.write((fs::path(metadataPath) / "child").string(), "x");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] Failed writes throw." << std::endl;

    // UploadScanner: files and non-recursive directories.
    const fs::path upload = testRoot / "upload";
    fs::create_directories(upload / "nested");
    { std::ofstream(upload / "B.sol") << "contract B {}"; }
    { std::ofstream(upload / "A.sol") << "contract A {}"; }
    { std::ofstream(upload / "nested" / "C.sol") << "contract C {}"; }
    { std::ofstream(testRoot / "metadata.json") << "{}"; }

    UploadScanner scanner;
    auto files = scanner.scan({upload.string(), (testRoot / "metadata.json").string()});
    assert(files.size() == 3);
    assert(files[0].name == "A.sol" && files[0].content == "contract A {}");
    assert(files[1].name == "B.sol");
    assert(files[2].name == "metadata.json" && files[2].content == "{}");

    thrown = false;
    try {
        scanner.scan({(testRoot / "nope").string()});
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] UploadScanner reads files and directories." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
