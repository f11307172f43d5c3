/**
 * @file ScopedTempFile.cpp
 * @brief Implementation of ScopedTempFile.
 */

#include "infrastructure/ScopedTempFile.hpp"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace promptwarden::infrastructure {

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long long> g_sequence{0};
}

ScopedTempFile::ScopedTempFile(const fs::path& directory, const std::string& suffix) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create transient directory " + directory.string() + ": " + ec.message());
    }

    // pid + clock + sequence keeps names unique across concurrent exchanges
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "promptwarden_" + std::to_string(::getpid()) + "_" +
                       std::to_string(now) + "_" + std::to_string(g_sequence++) + suffix;
    m_path = directory / name;
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        std::cerr << "[ScopedTempFile] Failed to remove " << m_path << ": " << ec.message() << std::endl;
    }
}

void ScopedTempFile::write(const std::string& bytes) {
    std::ofstream ofs(m_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open transient file: " + m_path.string());
    }
    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (ofs.fail()) {
        throw std::runtime_error("Write failed for transient file: " + m_path.string());
    }
}

TempDirStaging::TempDirStaging(fs::path directory)
    : m_directory(std::move(directory)) {}

std::unique_ptr<domain::StagedFile> TempDirStaging::stage(const std::string& bytes, const std::string& suffix) const {
    auto file = std::make_unique<ScopedTempFile>(m_directory, suffix);
    file->write(bytes);
    return file;
}

fs::path ScopedTempFile::DefaultDirectory() {
    return fs::temp_directory_path() / "promptwarden";
}

} // namespace promptwarden::infrastructure
