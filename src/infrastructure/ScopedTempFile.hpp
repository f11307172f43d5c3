/**
 * @file ScopedTempFile.hpp
 * @brief Request-scoped transient file, removed when the owner goes out of scope.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include "domain/StagingArea.hpp"

namespace promptwarden::infrastructure {

/**
 * @class ScopedTempFile
 * @brief Reserves a unique path under a directory and deletes it on destruction.
 *
 * The path is reserved, not created; either write() the bytes or let an
 * external tool produce the file. Whatever exists at the path when the object
 * is destroyed is removed, on every exit path.
 */
class ScopedTempFile : public domain::StagedFile {
public:
    ScopedTempFile(const std::filesystem::path& directory, const std::string& suffix);
    ~ScopedTempFile() override;

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    /** @brief Writes @p bytes to the reserved path (binary). Throws std::runtime_error on failure. */
    void write(const std::string& bytes);

    const std::filesystem::path& path() const override { return m_path; }

    /** @brief Default directory: $TMPDIR/promptwarden, created on demand. */
    static std::filesystem::path DefaultDirectory();

private:
    std::filesystem::path m_path;
};

/**
 * @class TempDirStaging
 * @brief StagingArea backed by ScopedTempFile under one directory.
 */
class TempDirStaging : public domain::StagingArea {
public:
    explicit TempDirStaging(std::filesystem::path directory);

    std::unique_ptr<domain::StagedFile> stage(const std::string& bytes, const std::string& suffix) const override;

    const std::filesystem::path& directory() const { return m_directory; }

private:
    std::filesystem::path m_directory;
};

} // namespace promptwarden::infrastructure
