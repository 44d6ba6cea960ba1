#include "bridgewatch/config.hpp"
#include "bridgewatch/errors.hpp"
#include "bridgewatch/utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <map>
#include <ostream>
#include <sstream>

#include <boost/program_options.hpp>
#include <oxen/log.hpp>

namespace po = boost::program_options;

namespace
{
auto logcat = oxen::log::Cat("config");

// Environment variables understood in place of command line options
const std::map<std::string, std::string> ENVIRONMENT_OPTIONS = {
    {"SOURCE_CHAIN_RPC_URL", "source-rpc-url"},
    {"BRIDGE_CONTRACT_ADDRESS", "bridge-contract"},
    {"BRIDGE_EVENT_TOPIC", "event-topic"},
    {"SOURCE_CHAIN_ID", "source-chain-id"},
    {"DESTINATION_ORACLE_API", "attestation-url"},
    {"ORACLE_API_KEY", "attestation-api-key"},
    {"POLLING_INTERVAL_SECONDS", "poll-interval"},
    {"BLOCK_CONFIRMATION_DELAY", "confirmations"},
    {"MAX_SCAN_RANGE", "max-range"},
    {"START_HEIGHT", "start-height"},
    {"INITIAL_LOOKBACK", "initial-lookback"},
    {"MAX_LEDGER_FAILURES", "max-ledger-failures"},
    {"RPC_TIMEOUT_MS", "rpc-timeout-ms"},
    {"HTTP_TIMEOUT_MS", "http-timeout-ms"},
    {"ATTESTATION_MAX_ATTEMPTS", "retry-attempts"},
    {"ATTESTATION_BACKOFF_BASE_MS", "retry-base-ms"},
    {"ATTESTATION_BACKOFF_FACTOR", "retry-factor"},
    {"ATTESTATION_BACKOFF_MAX_MS", "retry-max-delay-ms"},
    {"LOG_LEVEL", "log-level"},
};

constexpr std::array LOG_LEVELS = {"trace", "debug", "info", "warning", "error", "critical"};

po::options_description makeDescription()
{
    auto description = po::options_description{"bridgewatchd"};
    description.add_options()
        ("help,h", "Show the help message")
        ("config,c", po::value<std::string>(), "INI file with any of the options below")
        ("source-rpc-url", po::value<std::vector<std::string>>()->multitoken(),
            "Source chain JSON-RPC URL; repeat or comma-separate for failover")
        ("bridge-contract", po::value<std::string>(), "Bridge contract address")
        ("event-topic", po::value<std::string>(), "Topic hash of the BridgeTransferInitiated event")
        ("source-chain-id", po::value<std::string>(), "Source chain id (queried from the node if absent)")
        ("attestation-url", po::value<std::string>(), "Attestation API endpoint")
        ("attestation-api-key", po::value<std::string>(), "Bearer token for the attestation API")
        ("poll-interval", po::value<std::string>()->default_value("15"), "Seconds between polls")
        ("confirmations", po::value<std::string>()->default_value("6"), "Blocks behind the head considered final")
        ("max-range", po::value<std::string>()->default_value("2000"), "Maximum blocks covered by one log query")
        ("start-height", po::value<std::string>(), "First block to scan")
        ("initial-lookback", po::value<std::string>()->default_value("10"),
            "Blocks behind the safe height to start from when no start height is given")
        ("max-ledger-failures", po::value<std::string>()->default_value("40"),
            "Consecutive failed polls before giving up; 0 never gives up")
        ("rpc-timeout-ms", po::value<std::string>()->default_value("3000"), "JSON-RPC request timeout")
        ("http-timeout-ms", po::value<std::string>()->default_value("10000"), "Attestation request timeout")
        ("retry-attempts", po::value<std::string>()->default_value("5"), "Attestation attempts per record")
        ("retry-base-ms", po::value<std::string>()->default_value("1000"), "Delay before the first attestation retry")
        ("retry-factor", po::value<std::string>()->default_value("2"), "Backoff multiplier between attestation retries")
        ("retry-max-delay-ms", po::value<std::string>()->default_value("30000"), "Longest delay between attestation retries")
        ("log-level", po::value<std::string>()->default_value("info"), "trace, debug, info, warning, error or critical");
    return description;
}

template <typename T>
T parseNumber(const po::variables_map& vm, const std::string& name)
{
    const auto& text = vm[name].as<std::string>();
    uint64_t value;
    if (!bridgewatch::utils::parseInt(text, value) || value > std::numeric_limits<T>::max())
        throw bridgewatch::ConfigurationError{"Option " + name + " must be a non-negative integer, got \"" + text + "\""};
    return static_cast<T>(value);
}

std::string required(const po::variables_map& vm, const std::string& name)
{
    if (!vm.count(name) || vm[name].as<std::string>().empty())
        throw bridgewatch::ConfigurationError{"Missing required option " + name};
    return vm[name].as<std::string>();
}

bool isHttpUrl(std::string_view url)
{
    return url.starts_with("http://") || url.starts_with("https://");
}
}  // namespace

namespace bridgewatch
{
namespace log = oxen::log;

void Config::validate() const
{
    if (sourceRpcUrls.empty())
        throw ConfigurationError{"At least one source-rpc-url is required"};
    for (const auto& url : sourceRpcUrls)
    {
        if (!isHttpUrl(url))
            throw ConfigurationError{"Invalid source-rpc-url \"" + url + "\"; expected http:// or https://"};
    }
    if (!utils::isAddress(bridgeContract))
        throw ConfigurationError{"Invalid bridge-contract address \"" + bridgeContract + "\""};
    if (!utils::isHash32(eventTopic))
        throw ConfigurationError{"Invalid event-topic \"" + eventTopic + "\"; expected 0x followed by 64 hex digits"};
    if (!isHttpUrl(attestationUrl))
        throw ConfigurationError{"Invalid attestation-url \"" + attestationUrl + "\"; expected http:// or https://"};
    if (attestationApiKey.empty())
        throw ConfigurationError{"attestation-api-key must not be empty"};
    if (pollingInterval.count() <= 0)
        throw ConfigurationError{"poll-interval must be at least one second"};
    if (maxRangeSize == 0)
        throw ConfigurationError{"max-range must be at least one block"};
    if (startHeight && *startHeight == 0)
        throw ConfigurationError{"start-height must be at least 1"};
    if (rpcTimeout.count() <= 0 || httpTimeout.count() <= 0)
        throw ConfigurationError{"Timeouts must be positive"};
    if (maxAttempts == 0)
        throw ConfigurationError{"retry-attempts must be at least 1"};
    if (backoffFactor == 0)
        throw ConfigurationError{"retry-factor must be at least 1"};
    if (backoffMaxDelay < backoffBase)
        throw ConfigurationError{"retry-max-delay-ms must not be shorter than retry-base-ms"};
    if (std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), logLevel) == LOG_LEVELS.end())
        throw ConfigurationError{"Unknown log-level \"" + logLevel + "\""};
}

std::optional<Config> parseConfig(int argc, const char* const argv[], std::ostream& out)
{
    auto description = makeDescription();
    auto vm = po::variables_map{};
    try
    {
        po::store(po::parse_command_line(argc, argv, description), vm);
        po::store(po::parse_environment(description, [](const std::string& variable) -> std::string {
            auto it = ENVIRONMENT_OPTIONS.find(variable);
            return it == ENVIRONMENT_OPTIONS.end() ? "" : it->second;
        }), vm);

        if (vm.count("help"))
        {
            out << description << '\n';
            return std::nullopt;
        }

        if (vm.count("config"))
        {
            const auto& path = vm["config"].as<std::string>();
            std::ifstream file{path};
            if (!file)
                throw ConfigurationError{"Cannot open config file " + path};
            po::store(po::parse_config_file(file, description), vm);
            log::info(logcat, "Loaded configuration file {}", path);
        }
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw ConfigurationError{e.what()};
    }

    Config config;
    if (vm.count("source-rpc-url"))
    {
        for (const auto& value : vm["source-rpc-url"].as<std::vector<std::string>>())
        {
            std::istringstream urls{value};
            for (std::string url; std::getline(urls, url, ',');)
            {
                if (!url.empty())
                    config.sourceRpcUrls.push_back(url);
            }
        }
    }
    config.bridgeContract = required(vm, "bridge-contract");
    config.eventTopic = required(vm, "event-topic");
    if (vm.count("source-chain-id"))
        config.sourceChainId = parseNumber<uint64_t>(vm, "source-chain-id");
    config.attestationUrl = required(vm, "attestation-url");
    config.attestationApiKey = required(vm, "attestation-api-key");

    config.pollingInterval = std::chrono::seconds{parseNumber<uint32_t>(vm, "poll-interval")};
    config.confirmationDelay = parseNumber<uint64_t>(vm, "confirmations");
    config.maxRangeSize = parseNumber<uint64_t>(vm, "max-range");
    if (vm.count("start-height"))
        config.startHeight = parseNumber<uint64_t>(vm, "start-height");
    config.initialLookback = parseNumber<uint64_t>(vm, "initial-lookback");
    config.maxLedgerFailures = parseNumber<uint32_t>(vm, "max-ledger-failures");

    config.rpcTimeout = std::chrono::milliseconds{parseNumber<uint32_t>(vm, "rpc-timeout-ms")};
    config.httpTimeout = std::chrono::milliseconds{parseNumber<uint32_t>(vm, "http-timeout-ms")};
    config.maxAttempts = parseNumber<uint32_t>(vm, "retry-attempts");
    config.backoffBase = std::chrono::milliseconds{parseNumber<uint32_t>(vm, "retry-base-ms")};
    config.backoffFactor = parseNumber<uint32_t>(vm, "retry-factor");
    config.backoffMaxDelay = std::chrono::milliseconds{parseNumber<uint32_t>(vm, "retry-max-delay-ms")};
    config.logLevel = vm["log-level"].as<std::string>();

    config.validate();
    return config;
}
}  // namespace bridgewatch
