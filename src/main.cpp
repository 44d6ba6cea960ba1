#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <thread>

#include <oxen/log.hpp>

#include "bridgewatch/attestation_sink.hpp"
#include "bridgewatch/config.hpp"
#include "bridgewatch/errors.hpp"
#include "bridgewatch/orchestrator.hpp"
#include "bridgewatch/provider.hpp"
#include "bridgewatch/scanner.hpp"

namespace
{
namespace log = oxen::log;

auto logcat = log::Cat("bridgewatchd");

constexpr int EXIT_CONFIGURATION_ERROR = 2;

std::atomic<bool>& shutdown_requested() {
    static std::atomic<bool> requested{};
    return requested;
}

void signal_handler(int) {
    shutdown_requested() = true;
}
}  // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    log::add_sink(log::Type::Print, "stdout");
    log::reset_level(log::Level::info);

    std::optional<bridgewatch::Config> parsed;
    try
    {
        parsed = bridgewatch::parseConfig(argc, argv, std::cout);
    }
    catch (const bridgewatch::ConfigurationError& e)
    {
        log::critical(logcat, "Configuration error: {}", e.what());
        return EXIT_CONFIGURATION_ERROR;
    }
    if (!parsed)
        return 0;
    const bridgewatch::Config& config = *parsed;
    log::reset_level(log::level_from_string(config.logLevel));

    auto provider = bridgewatch::Provider::make_provider();
    provider->setTimeout(config.rpcTimeout);
    for (size_t i = 0; i < config.sourceRpcUrls.size(); i++)
        provider->addClient("source-" + std::to_string(i), config.sourceRpcUrls[i]);

    log::info(logcat, "--- bridgewatch starting: contract {}, {} rpc client(s), attestation endpoint {} ---",
            config.bridgeContract, provider->numClients(), config.attestationUrl);
    for (const auto& client : provider->getClients())
        log::debug(logcat, "RPC client {}: {}", client.name, client.url.str());

    uint64_t sourceChainId = 0;
    try
    {
        sourceChainId = config.sourceChainId ? *config.sourceChainId : provider->getNetworkChainId();
    }
    catch (const std::exception& e)
    {
        log::critical(logcat, "Cannot determine the source chain id: {}", e.what());
        return EXIT_FAILURE;
    }
    log::info(logcat, "Watching source chain {} with {} confirmations, polling every {}s",
            sourceChainId, config.confirmationDelay, config.pollingInterval.count());

    bridgewatch::EventScanner scanner{*provider, bridgewatch::ScannerOptions::fromConfig(config, sourceChainId)};
    bridgewatch::CprTransport transport{config.httpTimeout};
    bridgewatch::AttestationSink sink{transport, bridgewatch::SinkOptions::fromConfig(config)};
    bridgewatch::Orchestrator orchestrator{scanner, sink, config.pollingInterval};

    std::atomic<bool> finished{false};
    std::thread signal_watcher{[&] {
        while (!finished && !shutdown_requested())
            std::this_thread::sleep_for(100ms);
        if (shutdown_requested())
        {
            log::info(logcat, "Shutdown signal received");
            orchestrator.requestStop();
        }
    }};

    int rc = EXIT_SUCCESS;
    try
    {
        orchestrator.run();
    }
    catch (const std::exception& e)
    {
        log::critical(logcat, "bridgewatch failed: {}", e.what());
        rc = EXIT_FAILURE;
    }
    finished = true;
    signal_watcher.join();

    log::info(logcat, "--- bridgewatch stopped ---");
    return rc;
}
