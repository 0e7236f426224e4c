#pragma once

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/**
 * @brief Service configuration backed by Poco's JSONConfiguration
 *
 * Keys are addressed with Poco's dotted notation ("conversion.heic_decoder").
 * Getters fall back to built-in defaults for missing keys, so a partial file is
 * always usable.
 */
class ConverterConfig
{
public:
    static ConverterConfig &getInstance()
    {
        static ConverterConfig instance;
        return instance;
    }

    ConverterConfig();

    ConverterConfig(const ConverterConfig &) = delete;
    ConverterConfig &operator=(const ConverterConfig &) = delete;

    /**
     * @brief Replace the configuration with the content of a JSON file
     * @return false if the file cannot be opened or parsed; the previous
     *         configuration is kept in that case
     */
    bool load(const std::string &path);

    /**
     * @brief Same as load(), from a JSON document held in memory
     */
    bool loadFromString(const std::string &json_text);

    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a (possibly nested) JSON patch into the configuration
     */
    void update(const nlohmann::json &patch);

    /**
     * @brief Check ranges and enumerations
     * @return One message per problem; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    // Service
    std::string getLogLevel() const;
    std::string getServerHost() const;
    int getServerPort() const;
    int getMaxUploadMb() const;

    // Conversion pipeline
    std::string getScratchRoot() const;
    std::string getHeicDecoder() const;
    int getSampleIntervalMs() const;
    int getLowMemoryThresholdMb() const;
    int getStderrExcerptBytes() const;
    int getToolProbeTimeoutSeconds() const;

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;

private:
    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
