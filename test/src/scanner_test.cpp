#include "bridgewatch/errors.hpp"
#include "bridgewatch/scanner.hpp"
#include "bridgewatch/testing/fakes.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace bridgewatch;
using namespace bridgewatch::testing;

namespace
{
ScannerOptions options(std::optional<uint64_t> startHeight = std::nullopt)
{
    ScannerOptions opts;
    opts.selector = selector();
    opts.sourceChainId = 1;
    opts.confirmationDelay = 6;
    opts.maxRangeSize = 2000;
    opts.startHeight = startHeight;
    opts.maxLedgerFailures = 3;
    return opts;
}
}  // namespace

TEST_CASE( "Scan range stops at the confirmation depth", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;
    EventScanner scanner{ledger, options(101)};
    REQUIRE( scanner.lastProcessedHeight() == 100 );

    auto batch = scanner.scan();
    REQUIRE_FALSE( batch.empty() );
    REQUIRE( batch.range->fromHeight == 101 );
    REQUIRE( batch.range->toHeight == 106 );
    REQUIRE( ledger.queries.size() == 1 );
    REQUIRE( ledger.queries[0].fromHeight == 101 );
    REQUIRE( ledger.queries[0].toHeight == 106 );
}

TEST_CASE( "Nothing is scanned until a new block is confirmed", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 106;
    EventScanner scanner{ledger, options(101)};

    REQUIRE( scanner.scan().empty() );
    REQUIRE( ledger.queries.empty() );

    ledger.height = 107;
    auto batch = scanner.scan();
    REQUIRE( batch.range->fromHeight == 101 );
    REQUIRE( batch.range->toHeight == 101 );
    scanner.commit(batch);

    // Head has not moved past the confirmation delay of the committed range
    REQUIRE( scanner.scan().empty() );
    REQUIRE( ledger.queries.size() == 1 );

    ledger.height = 2;
    EventScanner early{ledger, options(1)};
    REQUIRE( early.scan().empty() );
    REQUIRE( ledger.queries.size() == 1 );
}

TEST_CASE( "A single scan never exceeds the maximum range", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 10'000;
    auto opts = options(1);
    opts.maxRangeSize = 500;
    EventScanner scanner{ledger, opts};

    uint64_t expectedFrom = 1;
    for (int i = 0; i < 5; i++)
    {
        auto batch = scanner.scan();
        REQUIRE( batch.range->fromHeight == expectedFrom );
        REQUIRE( batch.range->toHeight - batch.range->fromHeight + 1 == 500 );
        scanner.commit(batch);
        expectedFrom += 500;
    }

    ledger.height = 2506 + 6;
    auto tail = scanner.scan();
    REQUIRE( tail.range->fromHeight == 2501 );
    REQUIRE( tail.range->toHeight == 2506 );
}

TEST_CASE( "Records come back sorted by block and log index", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 130;
    ledger.logs = {
        TransferLog{.block = 120, .logIndex = 4, .nonce = 4}.entry(),
        TransferLog{.block = 103, .logIndex = 7, .nonce = 2}.entry(),
        TransferLog{.block = 120, .logIndex = 1, .nonce = 3}.entry(),
        TransferLog{.block = 103, .logIndex = 2, .nonce = 1}.entry(),
    };
    EventScanner scanner{ledger, options(101)};

    auto batch = scanner.scan();
    REQUIRE( batch.records.size() == 4 );
    for (size_t i = 0; i < batch.records.size(); i++)
        REQUIRE( batch.records[i].nonce() == i + 1 );
}

TEST_CASE( "Re-scanning without a commit reproduces the batch", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 130;
    ledger.logs = {
        TransferLog{.block = 110, .logIndex = 0, .nonce = 1}.entry(),
        TransferLog{.block = 111, .logIndex = 0, .nonce = 2}.entry(),
    };
    EventScanner scanner{ledger, options(101)};

    auto first = scanner.scan();
    auto second = scanner.scan();
    REQUIRE( first.range->fromHeight == second.range->fromHeight );
    REQUIRE( first.range->toHeight == second.range->toHeight );
    REQUIRE( first.records == second.records );
    REQUIRE( scanner.lastProcessedHeight() == 100 );
}

TEST_CASE( "A malformed log is skipped without stalling the cursor", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 130;
    auto broken = TransferLog{.block = 105, .logIndex = 1, .nonce = 2}.entry();
    broken.data = "0x" + word(TOKEN); // amount and nonce missing
    ledger.logs = {
        TransferLog{.block = 105, .logIndex = 0, .nonce = 1}.entry(),
        broken,
        TransferLog{.block = 106, .logIndex = 0, .nonce = 3}.entry(),
    };
    EventScanner scanner{ledger, options(101)};

    auto batch = scanner.scan();
    REQUIRE( batch.skippedLogs == 1 );
    REQUIRE( batch.records.size() == 2 );
    REQUIRE( batch.records[0].nonce() == 1 );
    REQUIRE( batch.records[1].nonce() == 3 );

    scanner.commit(batch);
    REQUIRE( scanner.lastProcessedHeight() == 124 );
}

TEST_CASE( "Logs outside the requested range, duplicates and removed logs are dropped", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;
    ledger.ignoreRange = true;
    auto removed = TransferLog{.block = 104, .logIndex = 0, .nonce = 9}.entry();
    removed.removed = true;
    ledger.logs = {
        TransferLog{.block = 102, .logIndex = 0, .nonce = 1}.entry(),
        TransferLog{.block = 102, .logIndex = 0, .nonce = 1}.entry(),
        TransferLog{.block = 110, .logIndex = 0, .nonce = 2}.entry(), // above the safe height
        removed,
    };
    EventScanner scanner{ledger, options(101)};

    auto batch = scanner.scan();
    REQUIRE( batch.records.size() == 1 );
    REQUIRE( batch.records[0].nonce() == 1 );
    for (const auto& record : batch.records)
        REQUIRE( record.blockNumber() <= 106 );
}

TEST_CASE( "A log for a different event is fatal", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;
    auto foreign = TransferLog{.block = 102, .logIndex = 0, .nonce = 1}.entry();
    foreign.topics[0] = "0x" + std::string(64, '1');
    ledger.logs = {foreign};
    EventScanner scanner{ledger, options(101)};

    REQUIRE_THROWS_AS( scanner.scan(), LedgerFatal );
    REQUIRE( scanner.lastProcessedHeight() == 100 );
}

TEST_CASE( "Ledger outages yield empty scans until the threshold", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;
    EventScanner scanner{ledger, options(101)};

    SECTION( "outages recover" ) {
        ledger.unavailableHeightCalls = 1;
        ledger.unavailableLogCalls = 1;
        REQUIRE( scanner.scan().empty() );
        REQUIRE( scanner.scan().empty() );
        REQUIRE( scanner.consecutiveFailures() == 2 );

        auto batch = scanner.scan();
        REQUIRE_FALSE( batch.empty() );
        REQUIRE( scanner.consecutiveFailures() == 0 );
        REQUIRE( scanner.lastProcessedHeight() == 100 );
    }
    SECTION( "persistent outage gives up" ) {
        ledger.unavailableHeightCalls = 10;
        REQUIRE( scanner.scan().empty() );
        REQUIRE( scanner.scan().empty() );
        REQUIRE_THROWS_AS( scanner.scan(), LedgerFatal );
    }
    SECTION( "fatal ledger errors propagate" ) {
        ledger.fatal = true;
        REQUIRE_THROWS_AS( scanner.scan(), LedgerFatal );
    }
}

TEST_CASE( "The cursor never moves backwards", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;
    EventScanner scanner{ledger, options(101)};

    auto early = scanner.scan();
    ledger.height = 130;
    auto late = scanner.scan();
    REQUIRE( late.range->toHeight == 124 );

    scanner.commit(late);
    REQUIRE( scanner.lastProcessedHeight() == 124 );
    scanner.commit(early);
    REQUIRE( scanner.lastProcessedHeight() == 124 );
    scanner.commit(ScanBatch{});
    REQUIRE( scanner.lastProcessedHeight() == 124 );

    ScanBatch gap;
    gap.range = ScanBatch::Range{200, 210};
    scanner.commit(gap);
    REQUIRE( scanner.lastProcessedHeight() == 124 );
}

TEST_CASE( "Without a start height the cursor starts just behind the safe height", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 1000;
    EventScanner scanner{ledger, options()};
    REQUIRE_FALSE( scanner.lastProcessedHeight() );

    auto batch = scanner.scan();
    REQUIRE( scanner.lastProcessedHeight() == 984 );
    REQUIRE( batch.range->fromHeight == 985 );
    REQUIRE( batch.range->toHeight == 994 );
}

TEST_CASE( "Unparseable and topic-less logs are skipped without stalling the cursor", "[scanner]" ) {
    FakeLedger ledger;
    ledger.height = 112;

    LogEntry unparseable;
    unparseable.parseError = "failed to parse integer from hex input";
    unparseable.transactionHash = txHash(1);
    auto noTopics = TransferLog{.block = 104, .logIndex = 0, .nonce = 2}.entry();
    noTopics.topics.clear();

    ledger.logs = {
        TransferLog{.block = 102, .logIndex = 0, .nonce = 1}.entry(),
        unparseable,
        noTopics,
        TransferLog{.block = 105, .logIndex = 3, .nonce = 3}.entry(),
    };
    EventScanner scanner{ledger, options(101)};

    auto batch = scanner.scan();
    REQUIRE( batch.skippedLogs == 2 );
    REQUIRE( batch.records.size() == 2 );
    REQUIRE( batch.records[0].nonce() == 1 );
    REQUIRE( batch.records[1].nonce() == 3 );

    scanner.commit(batch);
    REQUIRE( scanner.lastProcessedHeight() == 106 );
}
