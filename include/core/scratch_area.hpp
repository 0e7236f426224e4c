#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Private working directory of one conversion request
 *
 * Owns every file of the request (input, bridge, output). The directory is
 * removed recursively by release(), or by the destructor if release() was never
 * called, so it is removed exactly once on every exit path. Move-only.
 */
class ScratchArea
{
public:
    explicit ScratchArea(std::string path);
    ~ScratchArea();

    ScratchArea(const ScratchArea &) = delete;
    ScratchArea &operator=(const ScratchArea &) = delete;

    ScratchArea(ScratchArea &&other) noexcept;
    ScratchArea &operator=(ScratchArea &&other) noexcept;

    const std::string &getPath() const { return path_; }

    /**
     * @brief Absolute path of a file inside the area
     */
    std::string pathFor(const std::string &file_name) const;

    /**
     * @brief Write an artifact into the area
     * @param file_name Fixed artifact name, never client-supplied
     * @param data Bytes to write
     * @param error Receives a description on failure
     */
    bool writeArtifact(const std::string &file_name, const std::vector<uint8_t> &data, std::string &error) const;

    std::optional<std::vector<uint8_t>> readArtifact(const std::string &file_name, std::string &error) const;

    bool hasArtifact(const std::string &file_name) const;

    /**
     * @brief Remove the directory and everything in it
     * @return true if the directory is gone (also when it was already released)
     */
    bool release() noexcept;

    bool isReleased() const { return released_; }

private:
    std::string path_;
    bool released_{false};
};

/**
 * @brief Allocates scratch areas below a root directory
 */
class StagingAreaManager
{
public:
    /**
     * @param root_dir Parent directory; the system temp directory when empty
     */
    explicit StagingAreaManager(std::string root_dir = "");

    /**
     * @brief Create a new, uniquely named, owner-only directory
     * @param error Receives a description when the directory cannot be created
     * @return The area, or empty on failure (disk full, missing root, permissions)
     */
    std::optional<ScratchArea> acquire(std::string &error) const;

private:
    std::string root_dir_;
};
