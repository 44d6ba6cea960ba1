// errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace bridgewatch
{
/// A required configuration value is absent or malformed.  Raised before the service starts.
struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// The ledger could not be reached or answered with a transient error (timeout, transport
/// failure, 5xx, JSON-RPC error).  The current scan yields nothing and the next poll retries.
struct LedgerUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// The ledger endpoint can never serve us: malformed URL, authentication rejected, an event
/// selector the node does not honor, or too many consecutive unavailable polls.
struct LedgerFatal : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// A single log entry could not be turned into an EventRecord.
struct DecodingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
}  // namespace bridgewatch
