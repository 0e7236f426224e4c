#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File utilities for staging and collecting conversion artifacts
 */
class FileUtils
{
public:
    /**
     * @brief Write a buffer to a file, replacing any existing content
     * @param file_path Destination path
     * @param data Bytes to write
     * @param error Receives a description when the write fails
     * @return true if every byte was written and flushed
     */
    static bool writeFileBytes(const std::string &file_path, const std::vector<uint8_t> &data, std::string &error);

    /**
     * @brief Read a whole file into memory
     * @param file_path Path to the file
     * @param error Receives a description when the read fails
     * @return File content, or empty if the file could not be read
     */
    static std::optional<std::vector<uint8_t>> readFileBytes(const std::string &file_path, std::string &error);

    /**
     * @brief Size of a regular file
     * @return Empty if the file does not exist or is not a regular file
     */
    static std::optional<uint64_t> getFileSize(const std::string &file_path);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Make a client-supplied file name safe to print
     *
     * Keeps only the last path component, replaces control characters and
     * anything outside [A-Za-z0-9._-] with '_', and bounds the length. The result
     * is meant for log lines and response fields; it is never used to build paths.
     */
    static std::string sanitizeFilename(const std::string &filename, size_t max_length = 128);
};
