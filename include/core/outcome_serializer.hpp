#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "core/conversion_result.hpp"

/**
 * @brief JSON views of conversion outcomes and health reports for the HTTP layer
 *
 * Memory figures are reported in megabytes rounded to two decimals, durations in
 * seconds rounded to two decimals.
 */
class OutcomeSerializer
{
public:
    static nlohmann::json memoryToJson(const MemorySnapshot &snapshot);

    static nlohmann::json stageToJson(const StageResult &stage);

    static nlohmann::json metricsToJson(const ConversionMetrics &metrics);

    static nlohmann::json errorToJson(const ConversionError &error);

    /**
     * @brief Full response body for a conversion
     * @param outcome Result of ConversionOrchestrator::convert
     * @param filename Display name echoed back to the client
     * @return success, metrics and either data.fullSize (base64 AVIF) or error
     */
    static nlohmann::json toJson(const ConversionOutcome &outcome, const std::string &filename);

    /**
     * @brief Body of GET /health
     * @param tools Availability per probed tool; the service is healthy only when the encoder is available
     */
    static nlohmann::json healthToJson(const std::map<std::string, bool> &tools, const MemorySnapshot &snapshot);

    static std::string encodeBase64(const std::vector<uint8_t> &data);

    static double toMegabytes(uint64_t bytes);
};
