#include "bridgewatch/attestation_sink.hpp"
#include "bridgewatch/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <cpr/cpr.h>
#pragma GCC diagnostic push
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#include <nlohmann/json.hpp>
#pragma GCC diagnostic pop

#include <oxen/log.hpp>

namespace
{
auto logcat = oxen::log::Cat("sink");

// Longest slice of a response body repeated in logs and outcome reasons
constexpr size_t MAX_REASON_BODY = 200;

std::string describe(const bridgewatch::HttpResponse& response)
{
    if (response.transportFailed())
        return "transport error: " + response.error;
    auto reason = "http status " + std::to_string(response.status_code);
    if (!response.text.empty())
        reason += ": " + response.text.substr(0, MAX_REASON_BODY);
    return reason;
}
}  // namespace

namespace bridgewatch
{
namespace log = oxen::log;

CprTransport::CprTransport(std::chrono::milliseconds timeout)
{
    session.SetTimeout(timeout);
}

HttpResponse CprTransport::post(const std::string& url, const Headers& headers, const std::string& body)
{
    cpr::Header header;
    for (const auto& [key, value] : headers)
        header[key] = value;

    session.SetUrl(cpr::Url{url});
    session.SetHeader(header);
    session.SetBody(cpr::Body{body});
    auto r = session.Post();

    HttpResponse response;
    if (r.error.code != cpr::ErrorCode::OK)
    {
        response.error = r.error.message.empty() ? "unknown transport error" : r.error.message;
        return response;
    }
    response.status_code = r.status_code;
    response.text = std::move(r.text);
    return response;
}

std::string_view to_string(DeliveryOutcome::Kind kind)
{
    switch (kind)
    {
        case DeliveryOutcome::Kind::Delivered: return "Delivered";
        case DeliveryOutcome::Kind::RejectedPermanently: return "RejectedPermanently";
        case DeliveryOutcome::Kind::RetryableFailure: return "RetryableFailure";
    }
    return "Unknown";
}

std::chrono::milliseconds BackoffPolicy::delayAfter(uint32_t attempt) const
{
    auto delay = base;
    for (uint32_t i = 1; i < attempt && delay < maxDelay; ++i)
        delay *= factor;
    return std::min(delay, maxDelay);
}

SinkOptions SinkOptions::fromConfig(const Config& config)
{
    SinkOptions options;
    options.url = config.attestationUrl;
    options.apiKey = config.attestationApiKey;
    options.backoff = BackoffPolicy{config.maxAttempts, config.backoffBase, config.backoffFactor, config.backoffMaxDelay};
    return options;
}

nlohmann::json buildPayload(const EventRecord& record)
{
    nlohmann::json payload;
    payload["from"] = record.fromAddress();
    payload["to"] = record.toAddress();
    payload["token"] = record.token();
    payload["amount"] = record.amount().get_str();
    payload["sourceChainId"] = record.sourceChainId();
    payload["destinationChainId"] = record.destinationChainId();
    payload["nonce"] = record.nonce();
    payload["transactionHash"] = record.transactionHash();
    payload["blockNumber"] = record.blockNumber();
    payload["logIndex"] = record.logIndex();
    return payload;
}

AttestationSink::AttestationSink(HttpTransport& transport, SinkOptions options, Sleeper sleeper)
    : transport_(transport), options_(std::move(options)), sleeper_(std::move(sleeper))
{
    if (!sleeper_)
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    if (options_.backoff.maxAttempts == 0)
        throw std::invalid_argument{"AttestationSink needs at least one attempt per record"};
}

DeliveryOutcome AttestationSink::submit(const EventRecord& record)
{
    const auto body = buildPayload(record).dump();
    const Headers headers{
        {"Content-Type", "application/json"},
        {"Authorization", "Bearer " + options_.apiKey},
        {"Idempotency-Key", std::to_string(record.sourceChainId()) + ":" + std::to_string(record.nonce())},
    };

    for (uint32_t attempt = 1;; ++attempt)
    {
        ++stats_.attempts;
        HttpResponse response;
        try
        {
            response = transport_.post(options_.url, headers, body);
        }
        catch (const std::exception& e)
        {
            response = HttpResponse{};
            response.error = e.what();
        }

        auto reason = describe(response);
        if (!response.transportFailed() && response.status_code >= 200 && response.status_code < 300)
        {
            ++stats_.delivered;
            log::info(logcat, "Attestation for nonce {} (tx {}) delivered on attempt {} with status {}",
                    record.nonce(), record.transactionHash(), attempt, response.status_code);
            return {DeliveryOutcome::Kind::Delivered, "", attempt, response.status_code};
        }

        bool retryable = response.transportFailed() || response.status_code == 0
                || (response.status_code >= 500 && response.status_code < 600);
        if (!retryable)
        {
            ++stats_.rejected;
            log::error(logcat, "Attestation for nonce {} (tx {}) rejected on attempt {}: {}",
                    record.nonce(), record.transactionHash(), attempt, reason);
            return {DeliveryOutcome::Kind::RejectedPermanently, reason, attempt, response.status_code};
        }

        if (attempt >= options_.backoff.maxAttempts)
        {
            ++stats_.unavailable;
            log::error(logcat, "Attestation for nonce {} (tx {}) failed after {} attempts: {}",
                    record.nonce(), record.transactionHash(), attempt, reason);
            return {DeliveryOutcome::Kind::RetryableFailure, reason, attempt, response.status_code};
        }

        auto delay = options_.backoff.delayAfter(attempt);
        log::warning(logcat, "Attestation attempt {}/{} for nonce {} (tx {}) failed ({}); retrying in {}ms",
                attempt, options_.backoff.maxAttempts, record.nonce(), record.transactionHash(), reason, delay.count());
        sleeper_(delay);
    }
}
}  // namespace bridgewatch
