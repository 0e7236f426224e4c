#include "core/scratch_area.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/TemporaryFile.h>
#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    const int MAX_NAME_ATTEMPTS = 8;
}

ScratchArea::ScratchArea(std::string path) : path_(std::move(path))
{
}

ScratchArea::~ScratchArea()
{
    release();
}

ScratchArea::ScratchArea(ScratchArea &&other) noexcept
    : path_(std::move(other.path_)), released_(other.released_)
{
    other.released_ = true;
}

ScratchArea &ScratchArea::operator=(ScratchArea &&other) noexcept
{
    if (this != &other)
    {
        release();
        path_ = std::move(other.path_);
        released_ = other.released_;
        other.released_ = true;
    }
    return *this;
}

std::string ScratchArea::pathFor(const std::string &file_name) const
{
    return (fs::path(path_) / file_name).string();
}

bool ScratchArea::writeArtifact(const std::string &file_name, const std::vector<uint8_t> &data, std::string &error) const
{
    return FileUtils::writeFileBytes(pathFor(file_name), data, error);
}

std::optional<std::vector<uint8_t>> ScratchArea::readArtifact(const std::string &file_name, std::string &error) const
{
    return FileUtils::readFileBytes(pathFor(file_name), error);
}

bool ScratchArea::hasArtifact(const std::string &file_name) const
{
    return FileUtils::getFileSize(pathFor(file_name)).has_value();
}

bool ScratchArea::release() noexcept
{
    if (released_)
    {
        return true;
    }
    released_ = true;

    std::error_code ec;
    auto removed = fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::error("ScratchArea: failed to remove " + path_ + ": " + ec.message());
        return false;
    }
    Logger::trace("ScratchArea: removed " + path_ + " (" + std::to_string(removed) + " entries)");
    return true;
}

StagingAreaManager::StagingAreaManager(std::string root_dir) : root_dir_(std::move(root_dir))
{
}

std::optional<ScratchArea> StagingAreaManager::acquire(std::string &error) const
{
    std::error_code ec;
    fs::path root = root_dir_.empty() ? fs::temp_directory_path(ec) : fs::path(root_dir_);
    if (ec)
    {
        error = "no temporary directory available: " + ec.message();
        return std::nullopt;
    }

    if (!FileUtils::isValidDirectory(root.string()))
    {
        error = "scratch root is not a directory: " + root.string();
        return std::nullopt;
    }

    for (int attempt = 0; attempt < MAX_NAME_ATTEMPTS; ++attempt)
    {
        std::string candidate;
        try
        {
            // Name embeds pid and a process-wide counter
            candidate = Poco::TemporaryFile::tempName(root.string());
        }
        catch (const Poco::Exception &e)
        {
            error = "cannot generate scratch name: " + e.displayText();
            return std::nullopt;
        }

        fs::path dir = fs::path(candidate).parent_path() / ("avif-" + fs::path(candidate).filename().string());
        bool created = fs::create_directory(dir, ec);
        if (ec)
        {
            error = "cannot create scratch directory " + dir.string() + ": " + ec.message();
            return std::nullopt;
        }
        if (!created)
        {
            continue;
        }

        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            Logger::warn("StagingAreaManager: could not restrict permissions of " + dir.string() + ": " + ec.message());
        }
        return ScratchArea(dir.string());
    }

    error = "could not find an unused scratch directory name below " + root.string();
    return std::nullopt;
}
