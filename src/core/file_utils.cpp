#include "core/file_utils.hpp"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

bool FileUtils::writeFileBytes(const std::string &file_path, const std::vector<uint8_t> &data, std::string &error)
{
    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
        error = "cannot open " + file_path + " for writing: " + std::strerror(errno);
        return false;
    }

    if (!data.empty())
    {
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    out.flush();
    if (!out.good())
    {
        error = "failed writing " + std::to_string(data.size()) + " bytes to " + file_path;
        return false;
    }
    return true;
}

std::optional<std::vector<uint8_t>> FileUtils::readFileBytes(const std::string &file_path, std::string &error)
{
    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open())
    {
        error = "cannot open " + file_path + " for reading: " + std::strerror(errno);
        return std::nullopt;
    }

    in.seekg(0, std::ios::end);
    std::streamoff size = in.tellg();
    if (size < 0)
    {
        error = "cannot determine size of " + file_path;
        return std::nullopt;
    }
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char *>(data.data()), size))
    {
        error = "short read from " + file_path;
        return std::nullopt;
    }
    return data;
}

std::optional<uint64_t> FileUtils::getFileSize(const std::string &file_path)
{
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec) || ec)
    {
        return std::nullopt;
    }
    auto size = fs::file_size(file_path, ec);
    if (ec)
    {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}

std::string FileUtils::sanitizeFilename(const std::string &filename, size_t max_length)
{
    // Last component only; both separators, since uploads come from any OS
    std::string base = filename;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos)
    {
        base = base.substr(slash + 1);
    }

    std::string sanitized;
    sanitized.reserve(base.size());
    for (unsigned char c : base)
    {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_')
        {
            sanitized += static_cast<char>(c);
        }
        else
        {
            sanitized += '_';
        }
    }

    // Leading dots would make "..", "." or hidden names
    auto first = sanitized.find_first_not_of('.');
    sanitized = first == std::string::npos ? std::string() : sanitized.substr(first);

    if (sanitized.size() > max_length)
    {
        sanitized.resize(max_length);
    }
    return sanitized.empty() ? "unnamed" : sanitized;
}
