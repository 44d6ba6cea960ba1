// config.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

using namespace std::literals;

namespace bridgewatch
{
/// Everything the watcher needs to know, built once at startup and handed to each component by
/// const reference.
struct Config {
    // Source chain
    std::vector<std::string> sourceRpcUrls; // tried in order
    std::string bridgeContract;
    std::string eventTopic;
    std::optional<uint64_t> sourceChainId; // queried from the node when unset

    // Attestation service
    std::string attestationUrl;
    std::string attestationApiKey;

    // Scanning
    std::chrono::seconds pollingInterval = 15s;
    uint64_t confirmationDelay = 6;
    uint64_t maxRangeSize = 2000;
    std::optional<uint64_t> startHeight;
    uint64_t initialLookback = 10;
    uint32_t maxLedgerFailures = 40;

    // Timeouts and retries
    std::chrono::milliseconds rpcTimeout = 3s;
    std::chrono::milliseconds httpTimeout = 10s;
    uint32_t maxAttempts = 5;
    std::chrono::milliseconds backoffBase = 1s;
    uint32_t backoffFactor = 2;
    std::chrono::milliseconds backoffMaxDelay = 30s;

    std::string logLevel = "info";

    /// Throws ConfigurationError describing the first invalid value.
    void validate() const;
};

/// Builds a validated Config from, in order of precedence, the command line, the environment
/// (SOURCE_CHAIN_RPC_URL, BRIDGE_CONTRACT_ADDRESS, ...) and the INI file named by `--config`.
///
/// Returns std::nullopt after writing usage to `out` when `--help` is given.  Throws
/// ConfigurationError for missing, unknown or malformed values.
std::optional<Config> parseConfig(int argc, const char* const argv[], std::ostream& out);
}  // namespace bridgewatch
