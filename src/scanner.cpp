#include "bridgewatch/scanner.hpp"
#include "bridgewatch/config.hpp"
#include "bridgewatch/errors.hpp"
#include "bridgewatch/utils.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <tuple>

#include <oxen/log.hpp>

namespace
{
auto logcat = oxen::log::Cat("scanner");
}

namespace bridgewatch
{
namespace log = oxen::log;

ScannerOptions ScannerOptions::fromConfig(const Config& config, uint64_t sourceChainId)
{
    ScannerOptions options;
    options.selector = EventSelector{config.bridgeContract, config.eventTopic};
    options.sourceChainId = sourceChainId;
    options.confirmationDelay = config.confirmationDelay;
    options.maxRangeSize = config.maxRangeSize;
    options.startHeight = config.startHeight;
    options.initialLookback = config.initialLookback;
    options.maxLedgerFailures = config.maxLedgerFailures;
    return options;
}

EventScanner::EventScanner(LedgerClient& ledger, ScannerOptions options)
    : ledger_(ledger), options_(std::move(options))
{
    if (options_.maxRangeSize == 0)
        throw std::invalid_argument{"maxRangeSize must be at least one block"};
    options_.selector.topic = utils::toLowerHex(options_.selector.topic);
    if (options_.startHeight)
    {
        if (*options_.startHeight == 0)
            throw std::invalid_argument{"startHeight must be at least 1"};
        lastProcessedHeight_ = *options_.startHeight - 1;
    }
}

void EventScanner::initializeCursor(uint64_t safeHeight)
{
    lastProcessedHeight_ = safeHeight > options_.initialLookback ? safeHeight - options_.initialLookback : 0;
    log::info(logcat, "No start height configured; starting after block {} ({} blocks behind safe height {})",
            *lastProcessedHeight_, options_.initialLookback, safeHeight);
}

bool EventScanner::checkLedger()
{
    try
    {
        auto head = ledger_.getLatestHeight();
        log::info(logcat, "Ledger reachable; chain head at block {}", head);
        return true;
    }
    catch (const LedgerUnavailable& e)
    {
        log::warning(logcat, "Ledger not reachable yet, scans will keep retrying: {}", e.what());
        return false;
    }
}

ScanBatch EventScanner::scan()
{
    uint64_t currentHeight = 0;
    try
    {
        currentHeight = ledger_.getLatestHeight();
    }
    catch (const LedgerUnavailable& e)
    {
        return onLedgerUnavailable(e);
    }

    if (currentHeight < options_.confirmationDelay)
    {
        log::debug(logcat, "Chain head {} is within the confirmation delay of genesis; nothing to scan", currentHeight);
        consecutiveFailures_ = 0;
        return {};
    }
    uint64_t safeHeight = currentHeight - options_.confirmationDelay;

    if (!lastProcessedHeight_)
        initializeCursor(safeHeight);

    uint64_t last = *lastProcessedHeight_;
    if (safeHeight < last + 1)
    {
        log::debug(logcat, "No new confirmed blocks; head {}, safe height {}, last processed {}", currentHeight, safeHeight, last);
        consecutiveFailures_ = 0;
        return {};
    }

    uint64_t fromHeight = last + 1;
    uint64_t toHeight = safeHeight - last > options_.maxRangeSize ? last + options_.maxRangeSize : safeHeight;

    log::info(logcat, "Scanning blocks [{}, {}] (head {}, safe height {})", fromHeight, toHeight, currentHeight, safeHeight);
    try
    {
        auto batch = scanRange(fromHeight, toHeight);
        consecutiveFailures_ = 0;
        return batch;
    }
    catch (const LedgerUnavailable& e)
    {
        return onLedgerUnavailable(e);
    }
}

ScanBatch EventScanner::onLedgerUnavailable(const LedgerUnavailable& e)
{
    ++consecutiveFailures_;
    log::warning(logcat, "Ledger unavailable ({} consecutive): {}", consecutiveFailures_, e.what());
    if (options_.maxLedgerFailures > 0 && consecutiveFailures_ >= options_.maxLedgerFailures)
        throw LedgerFatal{"Ledger unavailable for " + std::to_string(consecutiveFailures_)
                + " consecutive polls, giving up: " + e.what()};
    return {};
}

ScanBatch EventScanner::scanRange(uint64_t fromHeight, uint64_t toHeight)
{
    auto logs = ledger_.getEvents(fromHeight, toHeight, options_.selector);

    ScanBatch batch;
    batch.range = ScanBatch::Range{fromHeight, toHeight};

    std::set<std::tuple<std::string, uint32_t>> seen;
    for (const auto& entry : logs)
    {
        auto txHash = entry.transactionHash.value_or("<unknown>");
        auto block = entry.blockNumber ? std::to_string(*entry.blockNumber) : std::string{"<unknown>"};

        if (entry.removed)
        {
            log::warning(logcat, "Skipping log from tx {} in block {} flagged as removed by a reorganization", txHash, block);
            continue;
        }
        // Malformed entries fall through to the decoding error below
        if (!entry.parseError && !entry.topics.empty()
                && utils::toLowerHex(entry.topics.front()) != options_.selector.topic)
            throw LedgerFatal{"Ledger returned a log from tx " + txHash + " that does not match event topic "
                    + options_.selector.topic};

        std::optional<EventRecord> record;
        try
        {
            record.emplace(decodeTransferLog(entry, options_.sourceChainId));
        }
        catch (const DecodingError& e)
        {
            ++batch.skippedLogs;
            log::error(logcat, "Skipping undecodable log from tx {} in block {}: {}", txHash, block, e.what());
            continue;
        }

        if (record->blockNumber() < fromHeight || record->blockNumber() > toHeight)
        {
            log::warning(logcat, "Dropping log from tx {} in block {} outside requested range [{}, {}]",
                    txHash, record->blockNumber(), fromHeight, toHeight);
            continue;
        }
        if (!seen.insert(record->logKey()).second)
        {
            log::warning(logcat, "Dropping duplicate log {} of tx {}", record->logIndex(), record->transactionHash());
            continue;
        }
        batch.records.push_back(std::move(*record));
    }

    std::stable_sort(batch.records.begin(), batch.records.end(), canonicalOrder);

    if (batch.records.empty())
        log::debug(logcat, "No transfer events in blocks [{}, {}]", fromHeight, toHeight);
    else
        log::info(logcat, "Found {} transfer event(s) in blocks [{}, {}]", batch.records.size(), fromHeight, toHeight);
    return batch;
}

void EventScanner::commit(const ScanBatch& batch)
{
    if (batch.empty())
        return;

    auto toHeight = batch.range->toHeight;
    if (lastProcessedHeight_ && toHeight <= *lastProcessedHeight_)
    {
        log::warning(logcat, "Ignoring stale commit to block {}; cursor already at {}", toHeight, *lastProcessedHeight_);
        return;
    }
    if (lastProcessedHeight_ && batch.range->fromHeight > *lastProcessedHeight_ + 1)
    {
        log::warning(logcat, "Ignoring commit of blocks [{}, {}]; it would skip unscanned blocks after {}",
                batch.range->fromHeight, toHeight, *lastProcessedHeight_);
        return;
    }
    lastProcessedHeight_ = toHeight;
    log::info(logcat, "Cursor advanced to block {}", toHeight);
}
}  // namespace bridgewatch
