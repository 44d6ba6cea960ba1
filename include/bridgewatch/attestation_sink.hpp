// attestation_sink.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <cpr/session.h>
#include <nlohmann/json_fwd.hpp>

#include "event_record.hpp"

using namespace std::literals;

namespace bridgewatch
{
struct Config;

using Headers = std::map<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;
    std::string text;
    // Set when no HTTP response was received (connection refused, timeout, TLS failure...)
    std::string error;

    bool transportFailed() const { return !error.empty(); }
};

/// Minimal HTTP client the sink delivers through.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse post(const std::string& url, const Headers& headers, const std::string& body) = 0;
};

/// HttpTransport over a reused cpr session.
class CprTransport : public HttpTransport {
public:
    explicit CprTransport(std::chrono::milliseconds timeout);

    HttpResponse post(const std::string& url, const Headers& headers, const std::string& body) override;

private:
    cpr::Session session;
};

struct DeliveryOutcome {
    enum class Kind {
        Delivered,
        RejectedPermanently,
        RetryableFailure,
    };

    Kind kind;
    std::string reason;
    uint32_t attempts = 0;
    long lastStatus = 0;

    bool resolved() const { return kind != Kind::RetryableFailure; }
};

std::string_view to_string(DeliveryOutcome::Kind kind);

struct BackoffPolicy {
    uint32_t maxAttempts = 5;
    std::chrono::milliseconds base = 1s;
    uint32_t factor = 2;
    std::chrono::milliseconds maxDelay = 30s;

    /// Delay to wait after failed attempt number `attempt` (1-based): base * factor^(attempt-1),
    /// capped at maxDelay.
    std::chrono::milliseconds delayAfter(uint32_t attempt) const;
};

struct SinkOptions {
    std::string url;
    std::string apiKey;
    BackoffPolicy backoff;

    static SinkOptions fromConfig(const Config& config);
};

struct SinkStats {
    uint64_t attempts = 0;
    uint64_t delivered = 0;
    uint64_t rejected = 0;
    uint64_t unavailable = 0;
};

/// The JSON body posted for `record`.  The amount is a decimal string so no consumer can lose
/// precision on 256-bit values.
nlohmann::json buildPayload(const EventRecord& record);

/// Delivers records to the attestation API.
///
/// Transport failures and 5xx responses are retried with exponential backoff up to
/// `backoff.maxAttempts` attempts, after which the record is reported as a RetryableFailure.  Any
/// other non-2xx status means the payload itself was refused and is reported as
/// RejectedPermanently without retrying.  The remote service is expected to deduplicate on the
/// record nonce, sent as the Idempotency-Key header.
class AttestationSink {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    AttestationSink(HttpTransport& transport, SinkOptions options, Sleeper sleeper = {});

    DeliveryOutcome submit(const EventRecord& record);

    const SinkStats& stats() const { return stats_; }

private:
    HttpTransport& transport_;
    SinkOptions options_;
    Sleeper sleeper_;
    SinkStats stats_;
};
}  // namespace bridgewatch
