// ledger_client.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "logs.hpp"

namespace bridgewatch
{
/// Identifies the logs a scan is interested in: one event (by its topic) emitted by one contract.
struct EventSelector {
    std::string contractAddress;
    std::string topic;
};

/// Read-only access to the source ledger.
///
/// Implementations report transient trouble (timeouts, transport errors, overloaded nodes) by
/// throwing LedgerUnavailable and conditions that retrying cannot fix (bad endpoint, rejected
/// credentials) by throwing LedgerFatal.
class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    virtual uint64_t getLatestHeight() = 0;

    /// Returns the logs matching `selector` in the inclusive block range [fromHeight, toHeight].
    virtual std::vector<LogEntry> getEvents(uint64_t fromHeight, uint64_t toHeight, const EventSelector& selector) = 0;
};
}  // namespace bridgewatch
