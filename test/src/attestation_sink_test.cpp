#include "bridgewatch/attestation_sink.hpp"
#include "bridgewatch/testing/fakes.hpp"

#include <stdexcept>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

using namespace bridgewatch;
using namespace bridgewatch::testing;

namespace
{
SinkOptions sinkOptions()
{
    SinkOptions options;
    options.url = "https://attest.example.org/v1/attestations";
    options.apiKey = "secret-key";
    return options;
}

EventRecord sampleRecord(uint64_t nonce = 42)
{
    return decodeTransferLog(TransferLog{.block = 500, .logIndex = 1, .nonce = nonce}.entry(), 11155111);
}

struct RecordingSleeper {
    std::vector<std::chrono::milliseconds> delays;
    AttestationSink::Sleeper fn() {
        return [this](std::chrono::milliseconds d) { delays.push_back(d); };
    }
};

class ThrowingTransport : public HttpTransport {
public:
    int calls = 0;
    HttpResponse post(const std::string&, const Headers&, const std::string&) override
    {
        if (++calls == 1)
            throw std::runtime_error{"socket closed"};
        return HttpResponse{201, "", ""};
    }
};
}  // namespace

TEST_CASE( "A 2xx response delivers the attestation", "[sink]" ) {
    FakeTransport transport;
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    auto outcome = sink.submit(sampleRecord());
    REQUIRE( outcome.kind == DeliveryOutcome::Kind::Delivered );
    REQUIRE( outcome.attempts == 1 );
    REQUIRE( outcome.lastStatus == 200 );
    REQUIRE( sleeper.delays.empty() );

    REQUIRE( transport.requests.size() == 1 );
    const auto& request = transport.requests[0];
    REQUIRE( request.url == "https://attest.example.org/v1/attestations" );
    REQUIRE( request.headers.at("Authorization") == "Bearer secret-key" );
    REQUIRE( request.headers.at("Content-Type") == "application/json" );
    REQUIRE( request.headers.at("Idempotency-Key") == "11155111:42" );

    auto body = nlohmann::json::parse(request.body);
    REQUIRE( body["nonce"] == 42 );
    REQUIRE( body["amount"] == "1000000000000000000" );
    REQUIRE( body["blockNumber"] == 500 );
}

TEST_CASE( "A 400 response is rejected without retrying", "[sink]" ) {
    FakeTransport transport;
    transport.script = {HttpResponse{400, "{\"error\":\"bad payload\"}", ""}};
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    auto outcome = sink.submit(sampleRecord());
    REQUIRE( outcome.kind == DeliveryOutcome::Kind::RejectedPermanently );
    REQUIRE( outcome.resolved() );
    REQUIRE( outcome.attempts == 1 );
    REQUIRE( outcome.lastStatus == 400 );
    REQUIRE( outcome.reason.find("bad payload") != std::string::npos );
    REQUIRE( transport.requests.size() == 1 );
    REQUIRE( sleeper.delays.empty() );
    REQUIRE( sink.stats().rejected == 1 );
}

TEST_CASE( "Other non-2xx statuses are permanent rejections", "[sink]" ) {
    FakeTransport transport;
    transport.script = {FakeTransport::status(401), FakeTransport::status(302)};
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    REQUIRE( sink.submit(sampleRecord(1)).kind == DeliveryOutcome::Kind::RejectedPermanently );
    REQUIRE( sink.submit(sampleRecord(2)).kind == DeliveryOutcome::Kind::RejectedPermanently );
    REQUIRE( transport.requests.size() == 2 );
}

TEST_CASE( "Server errors are retried with exponential backoff", "[sink]" ) {
    FakeTransport transport;
    transport.fallback = FakeTransport::status(503);
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    auto outcome = sink.submit(sampleRecord());
    REQUIRE( outcome.kind == DeliveryOutcome::Kind::RetryableFailure );
    REQUIRE_FALSE( outcome.resolved() );
    REQUIRE( outcome.attempts == 5 );
    REQUIRE( transport.requests.size() == 5 );
    REQUIRE( sleeper.delays == std::vector<std::chrono::milliseconds>{1s, 2s, 4s, 8s} );

    REQUIRE( sink.stats().attempts == 5 );
    REQUIRE( sink.stats().unavailable == 1 );
    REQUIRE( sink.stats().delivered == 0 );
}

TEST_CASE( "Transport failures recover within the retry budget", "[sink]" ) {
    FakeTransport transport;
    transport.script = {FakeTransport::unreachable(), FakeTransport::status(502)};
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    auto outcome = sink.submit(sampleRecord());
    REQUIRE( outcome.kind == DeliveryOutcome::Kind::Delivered );
    REQUIRE( outcome.attempts == 3 );
    REQUIRE( sleeper.delays.size() == 2 );
    REQUIRE( sink.stats().attempts == 3 );
    REQUIRE( sink.stats().delivered == 1 );
}

TEST_CASE( "Exceptions from the transport count as transport failures", "[sink]" ) {
    ThrowingTransport transport;
    RecordingSleeper sleeper;
    AttestationSink sink{transport, sinkOptions(), sleeper.fn()};

    auto outcome = sink.submit(sampleRecord());
    REQUIRE( outcome.kind == DeliveryOutcome::Kind::Delivered );
    REQUIRE( transport.calls == 2 );
    REQUIRE( sleeper.delays == std::vector<std::chrono::milliseconds>{1s} );
}

TEST_CASE( "Backoff delays are capped", "[sink]" ) {
    BackoffPolicy policy{10, 1s, 3, 20s};
    REQUIRE( policy.delayAfter(1) == 1s );
    REQUIRE( policy.delayAfter(2) == 3s );
    REQUIRE( policy.delayAfter(3) == 9s );
    REQUIRE( policy.delayAfter(4) == 20s );
    REQUIRE( policy.delayAfter(9) == 20s );
}
