#pragma once

#include "core/conversion_orchestrator.hpp"
#include "core/disconnect_watcher.hpp"
#include "core/file_utils.hpp"
#include "core/outcome_serializer.hpp"
#include "core/resource_monitor.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <functional>
#include <httplib.h>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using json = nlohmann::json;

// Request::is_connection_closed only exists in newer cpp-httplib releases
template <typename Request, typename = void>
struct HasConnectionClosedCheck : std::false_type
{
};

template <typename Request>
struct HasConnectionClosedCheck<Request, std::void_t<decltype(std::declval<const Request &>().is_connection_closed)>>
    : std::true_type
{
};

class RouteHandlers
{
public:
    static void setupRoutes(httplib::Server &svr, const ConversionOrchestrator &orchestrator)
    {
        // Health endpoint
        svr.Get("/health", [&orchestrator](const httplib::Request &req, httplib::Response &res)
                { handleHealth(req, res, orchestrator); });

        // Conversion endpoint
        svr.Post("/convert", [&orchestrator](const httplib::Request &req, httplib::Response &res)
                 { handleConvert(req, res, orchestrator); });
    }

private:
    static void handleHealth(const httplib::Request &req, httplib::Response &res, const ConversionOrchestrator &orchestrator)
    {
        (void)req;
        try
        {
            std::map<std::string, bool> tools;
            for (const auto &tool : orchestrator.requiredTools())
            {
                tools[tool] = orchestrator.toolAvailable(tool);
            }

            json response = OutcomeSerializer::healthToJson(tools, ResourceMonitor::takeSnapshot());
            Logger::debug("Health check: " + response["status"].get<std::string>());
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in health check: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
        }
    }

    // Empty when the library cannot tell us about disconnects
    template <typename Request>
    static std::function<bool()> connectionClosedCheck(const Request &req)
    {
        if constexpr (HasConnectionClosedCheck<Request>::value)
        {
            return [&req]()
            { return req.is_connection_closed && req.is_connection_closed(); };
        }
        else
        {
            return {};
        }
    }

    static void handleConvert(const httplib::Request &req, httplib::Response &res, const ConversionOrchestrator &orchestrator)
    {
        try
        {
            if (!req.has_file("image"))
            {
                res.status = 400;
                res.set_content(json{{"error", "Missing multipart field 'image'"}}.dump(), "application/json");
                return;
            }

            const auto file = req.get_file_value("image");
            const std::string filename = FileUtils::sanitizeFilename(file.filename);
            Logger::info("Convert request: " + filename + ", type=" + file.content_type + ", " +
                         ResourceMonitor::formatBytes(file.content.size()));

            auto format_tag = formatTagFromMimeType(file.content_type);
            if (!format_tag)
            {
                Logger::warn("Convert request rejected, unsupported MIME type: " + file.content_type);
                res.status = 400;
                res.set_content(json{{"error", "Only JPEG and HEIC images are supported."}}.dump(), "application/json");
                return;
            }

            ConversionRequest request(std::vector<uint8_t>(file.content.begin(), file.content.end()), *format_tag, filename);
            ConversionOutcome outcome;
            {
                ScopedConversion conversion(ShutdownManager::getInstance());
                DisconnectWatcher watcher(connectionClosedCheck(req), conversion.getToken());
                outcome = orchestrator.convert(std::move(request), &conversion.getToken());
                if (watcher.callerWentAway())
                {
                    Logger::info("Convert request abandoned by client: " + filename);
                }
            }

            json response = OutcomeSerializer::toJson(outcome, filename);
            if (outcome.success)
            {
                res.set_content(response.dump(), "application/json");
                return;
            }

            if (outcome.error && outcome.error->isClientError())
            {
                res.status = 400;
            }
            else
            {
                // Tool output stays in the log
                res.status = 500;
                response["error"]["message"] = "Conversion failed.";
            }
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in convert request: " + std::string(e.what()));
            res.status = 500;
            res.set_content(json{{"error", "Internal server error"}}.dump(), "application/json");
        }
    }
};
