#include "core/converter_config.hpp"
#include "core/pipeline_planner.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    const char *const DEFAULT_LOG_LEVEL = "INFO";
    const char *const DEFAULT_SERVER_HOST = "0.0.0.0";
    const int DEFAULT_SERVER_PORT = 3001;
    const int DEFAULT_MAX_UPLOAD_MB = 100;

    const char *const DEFAULT_HEIC_DECODER = "libheif";
    const int DEFAULT_SAMPLE_INTERVAL_MS = 100;
    const int DEFAULT_LOW_MEMORY_THRESHOLD_MB = 100;
    const int DEFAULT_STDERR_EXCERPT_BYTES = 2048;
    const int DEFAULT_TOOL_PROBE_TIMEOUT_SECONDS = 5;
}

ConverterConfig::ConverterConfig()
{
    initializeDefaultConfig();
}

void ConverterConfig::initializeDefaultConfig()
{
    nlohmann::json defaults = {
        {"log_level", DEFAULT_LOG_LEVEL},
        {"server_host", DEFAULT_SERVER_HOST},
        {"server_port", DEFAULT_SERVER_PORT},
        {"max_upload_mb", DEFAULT_MAX_UPLOAD_MB},
        {"conversion",
         {{"scratch_root", ""},
          {"heic_decoder", DEFAULT_HEIC_DECODER},
          {"sample_interval_ms", DEFAULT_SAMPLE_INTERVAL_MS},
          {"low_memory_threshold_mb", DEFAULT_LOW_MEMORY_THRESHOLD_MB},
          {"stderr_excerpt_bytes", DEFAULT_STDERR_EXCERPT_BYTES},
          {"tool_probe_timeout_seconds", DEFAULT_TOOL_PROBE_TIMEOUT_SECONDS}}}};

    std::istringstream in(defaults.dump());
    AutoPtr<JSONConfiguration> cfg = new JSONConfiguration();
    cfg->load(in);
    cfg_ = cfg;
}

bool ConverterConfig::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        return false;
    }

    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("ConverterConfig: failed to parse " + path + ": " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    return true;
}

bool ConverterConfig::loadFromString(const std::string &json_text)
{
    std::istringstream in(json_text);
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("ConverterConfig: failed to parse configuration: " + e.displayText());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = tmp;
    return true;
}

bool ConverterConfig::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return out.good();
}

nlohmann::json ConverterConfig::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void ConverterConfig::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten nested objects into dotted keys
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::vector<std::string> ConverterConfig::validate() const
{
    std::vector<std::string> problems;

    if (!Logger::isValidLevel(getLogLevel()))
    {
        problems.push_back("log_level must be one of TRACE, DEBUG, INFO, WARN, ERROR");
    }

    int port = getServerPort();
    if (port < 1 || port > 65535)
    {
        problems.push_back("server_port out of range: " + std::to_string(port));
    }

    if (getMaxUploadMb() < 1)
    {
        problems.push_back("max_upload_mb must be positive");
    }

    if (!parseHeicDecodeStrategy(getHeicDecoder()))
    {
        problems.push_back("conversion.heic_decoder must be libheif or ffmpeg, got '" + getHeicDecoder() + "'");
    }

    int interval = getSampleIntervalMs();
    if (interval < 10 || interval > 10000)
    {
        problems.push_back("conversion.sample_interval_ms must be between 10 and 10000");
    }

    if (getLowMemoryThresholdMb() < 0)
    {
        problems.push_back("conversion.low_memory_threshold_mb must not be negative");
    }

    if (getStderrExcerptBytes() < 64)
    {
        problems.push_back("conversion.stderr_excerpt_bytes must be at least 64");
    }

    if (getToolProbeTimeoutSeconds() < 1)
    {
        problems.push_back("conversion.tool_probe_timeout_seconds must be at least 1");
    }

    return problems;
}

std::string ConverterConfig::getLogLevel() const
{
    return getString("log_level", DEFAULT_LOG_LEVEL);
}

std::string ConverterConfig::getServerHost() const
{
    return getString("server_host", DEFAULT_SERVER_HOST);
}

int ConverterConfig::getServerPort() const
{
    return getInt("server_port", DEFAULT_SERVER_PORT);
}

int ConverterConfig::getMaxUploadMb() const
{
    return getInt("max_upload_mb", DEFAULT_MAX_UPLOAD_MB);
}

std::string ConverterConfig::getScratchRoot() const
{
    return getString("conversion.scratch_root", "");
}

std::string ConverterConfig::getHeicDecoder() const
{
    return getString("conversion.heic_decoder", DEFAULT_HEIC_DECODER);
}

int ConverterConfig::getSampleIntervalMs() const
{
    return getInt("conversion.sample_interval_ms", DEFAULT_SAMPLE_INTERVAL_MS);
}

int ConverterConfig::getLowMemoryThresholdMb() const
{
    return getInt("conversion.low_memory_threshold_mb", DEFAULT_LOW_MEMORY_THRESHOLD_MB);
}

int ConverterConfig::getStderrExcerptBytes() const
{
    return getInt("conversion.stderr_excerpt_bytes", DEFAULT_STDERR_EXCERPT_BYTES);
}

int ConverterConfig::getToolProbeTimeoutSeconds() const
{
    return getInt("conversion.tool_probe_timeout_seconds", DEFAULT_TOOL_PROBE_TIMEOUT_SECONDS);
}

std::string ConverterConfig::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConverterConfig::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("ConverterConfig: " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}
