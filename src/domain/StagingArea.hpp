/**
 * @file StagingArea.hpp
 * @brief Interface for request-scoped transient files handed to external tools.
 */

#pragma once
#include <filesystem>
#include <memory>
#include <string>

namespace promptwarden::domain {

/**
 * @class StagedFile
 * @brief A file that exists for as long as its owner; destruction removes it.
 */
class StagedFile {
public:
    virtual ~StagedFile() = default;

    virtual const std::filesystem::path& path() const = 0;
};

/**
 * @class StagingArea
 * @brief Places upload bytes on disk for extractors that need a real path.
 */
class StagingArea {
public:
    virtual ~StagingArea() = default;

    /**
     * @brief Writes @p bytes to a fresh file ending in @p suffix.
     * @throws std::runtime_error if the file cannot be created or written.
     */
    virtual std::unique_ptr<StagedFile> stage(const std::string& bytes, const std::string& suffix) const = 0;
};

} // namespace promptwarden::domain
