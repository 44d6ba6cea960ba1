// scanner.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "errors.hpp"
#include "event_record.hpp"
#include "ledger_client.hpp"

namespace bridgewatch
{
struct Config;

/// The outcome of one scan.  `range` is unset when nothing was scanned (no new safe blocks, or
/// the ledger was unavailable); otherwise it is the inclusive block range the records cover.
struct ScanBatch {
    struct Range {
        uint64_t fromHeight;
        uint64_t toHeight;
    };
    std::optional<Range> range;
    std::vector<EventRecord> records;
    size_t skippedLogs = 0;

    bool empty() const { return !range; }
};

struct ScannerOptions {
    EventSelector selector;
    uint64_t sourceChainId = 0;
    uint64_t confirmationDelay = 6;
    uint64_t maxRangeSize = 2000;
    // First block to scan; when unset the scan starts `initialLookback` blocks behind the first
    // safe height observed.
    std::optional<uint64_t> startHeight;
    uint64_t initialLookback = 10;
    // Consecutive unavailable scans tolerated before giving up; 0 never gives up.
    uint32_t maxLedgerFailures = 40;

    static ScannerOptions fromConfig(const Config& config, uint64_t sourceChainId);
};

/// Finds bridge transfer events in confirmed blocks the pipeline has not yet resolved.
///
/// `scan()` never moves the cursor: calling it again without `commit()` reproduces the same
/// batch from the same ledger state.  Only blocks at least `confirmationDelay` behind the head
/// are scanned, and no single scan spans more than `maxRangeSize` blocks.  Reorganizations deeper
/// than the confirmation delay are not detected.
class EventScanner {
public:
    EventScanner(LedgerClient& ledger, ScannerOptions options);

    /// Throws LedgerFatal for conditions retrying cannot fix; transient ledger failures produce
    /// an empty batch.
    ScanBatch scan();

    /// Queries the chain head once to see whether the ledger answers.  Returns false when it is
    /// unavailable; LedgerFatal propagates.  Does not count towards `maxLedgerFailures`.
    bool checkLedger();

    /// Marks every record of `batch` as resolved and moves the cursor to the end of its range.
    /// Commits that would move the cursor backwards are ignored.
    void commit(const ScanBatch& batch);

    /// Last block whose events have all been resolved; unset until the first scan initializes it.
    std::optional<uint64_t> lastProcessedHeight() const { return lastProcessedHeight_; }

    uint32_t consecutiveFailures() const { return consecutiveFailures_; }

private:
    ScanBatch scanRange(uint64_t fromHeight, uint64_t toHeight);
    ScanBatch onLedgerUnavailable(const LedgerUnavailable& e);
    void initializeCursor(uint64_t safeHeight);

    LedgerClient& ledger_;
    ScannerOptions options_;
    std::optional<uint64_t> lastProcessedHeight_;
    uint32_t consecutiveFailures_ = 0;
};
}  // namespace bridgewatch
