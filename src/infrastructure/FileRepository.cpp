/**
 * @file FileRepository.cpp
 * @brief Implementation of the FileRepository class.
 */
#include "infrastructure/FileRepository.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace sourceproof::infrastructure {

namespace {

std::atomic<unsigned long> g_writeCounter{0};

} // namespace

void FileRepository::write(const std::string& path, const std::string& content) {
    fs::path finalPath = path;

    // Create unique temp path: filename.<timestamp>.<thread>.<counter>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::ostringstream suffix;
    suffix << "." << timestamp << "." << std::this_thread::get_id() << "." << g_writeCounter++ << ".tmp";
    fs::path tempPath = finalPath;
    tempPath += suffix.str();

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path()) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[FileRepository] Error creating directories: " << e.what() << std::endl;
        throw std::runtime_error("Cannot create directory for " + path + ": " + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[FileRepository] Failed to open temp file: " << tempPath << std::endl;
            throw std::runtime_error("Cannot open " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileRepository] Write failed during output: " << tempPath << std::endl;
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed for " + path);
        }
    }

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[FileRepository] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error("Cannot move " + tempPath.string() + " to " + path + ": " + e.what());
    }
}

std::string FileRepository::read(const std::string& path) const {
    fs::path p = path;
    if (!fs::exists(p)) return "";

    std::ifstream file(p, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace sourceproof::infrastructure
