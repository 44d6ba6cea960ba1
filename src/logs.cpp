#include "bridgewatch/logs.hpp"
#include "bridgewatch/utils.hpp"

#include <limits>
#include <stdexcept>

#pragma GCC diagnostic push
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#include <nlohmann/json.hpp>
#pragma GCC diagnostic pop

namespace bridgewatch
{
static uint32_t parseIndex(const nlohmann::json& value, std::string_view name)
{
    auto index = utils::hexStringToU64(value.get<std::string>());
    if (index > std::numeric_limits<uint32_t>::max())
        throw std::runtime_error{"Error " + std::string{name} + " element > uint32_t max"};
    return static_cast<uint32_t>(index);
}

LogEntry parseLogEntry(const nlohmann::json& logJson)
{
    LogEntry logEntry;
    logEntry.address = logJson.contains("address") ? logJson["address"].get<std::string>() : "";

    if (logJson.contains("topics")) {
        for (const auto& topic : logJson["topics"]) {
            logEntry.topics.push_back(topic.get<std::string>());
        }
    }

    logEntry.data = logJson.contains("data") ? logJson["data"].get<std::string>() : "";
    // Pending logs carry explicit nulls for their position fields
    auto present = [&logJson](const char* key) { return logJson.contains(key) && !logJson[key].is_null(); };

    logEntry.blockNumber = present("blockNumber") ? std::make_optional(utils::hexStringToU64(logJson["blockNumber"].get<std::string>())) : std::nullopt;
    logEntry.transactionHash = present("transactionHash") ? std::make_optional(logJson["transactionHash"].get<std::string>()) : std::nullopt;
    logEntry.transactionIndex = present("transactionIndex") ? std::make_optional(parseIndex(logJson["transactionIndex"], "transactionIndex")) : std::nullopt;
    logEntry.blockHash = present("blockHash") ? std::make_optional(logJson["blockHash"].get<std::string>()) : std::nullopt;
    logEntry.logIndex = present("logIndex") ? std::make_optional(parseIndex(logJson["logIndex"], "logIndex")) : std::nullopt;

    logEntry.removed = logJson.contains("removed") ? logJson["removed"].get<bool>() : false;
    return logEntry;
}

static LogEntry malformedLogEntry(const nlohmann::json& logJson, std::string error)
{
    LogEntry logEntry;
    logEntry.parseError = std::move(error);
    if (logJson.is_object())
    {
        if (auto it = logJson.find("transactionHash"); it != logJson.end() && it->is_string())
            logEntry.transactionHash = it->get<std::string>();
    }
    return logEntry;
}

std::vector<LogEntry> parseLogEntries(const nlohmann::json& responseJson)
{
    if (!responseJson.is_array())
        throw std::runtime_error{"eth_getLogs result is not an array"};

    std::vector<LogEntry> logEntries;
    logEntries.reserve(responseJson.size());
    for (const auto& logJson : responseJson)
    {
        try
        {
            logEntries.push_back(parseLogEntry(logJson));
        }
        catch (const std::exception& e)
        {
            logEntries.push_back(malformedLogEntry(logJson, e.what()));
        }
    }
    return logEntries;
}
}  // namespace bridgewatch
