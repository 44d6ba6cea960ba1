#include "bridgewatch/orchestrator.hpp"

#include <oxen/log.hpp>

namespace
{
auto logcat = oxen::log::Cat("orchestrator");
}

namespace bridgewatch
{
namespace log = oxen::log;

std::string_view to_string(Orchestrator::State state)
{
    switch (state)
    {
        case Orchestrator::State::Starting: return "Starting";
        case Orchestrator::State::Running: return "Running";
        case Orchestrator::State::Stopping: return "Stopping";
        case Orchestrator::State::Stopped: return "Stopped";
        case Orchestrator::State::Failed: return "Failed";
    }
    return "Unknown";
}

Orchestrator::Orchestrator(EventScanner& scanner, AttestationSink& sink, std::chrono::milliseconds pollingInterval)
    : scanner_(scanner), sink_(sink), pollingInterval_(pollingInterval)
{
}

Orchestrator::State Orchestrator::state() const
{
    std::lock_guard lk{mutex_};
    return state_;
}

void Orchestrator::transition(State next)
{
    std::lock_guard lk{mutex_};
    if (state_ == next)
        return;
    log::info(logcat, "Orchestrator {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

void Orchestrator::requestStop()
{
    {
        std::lock_guard lk{mutex_};
        stopRequested_ = true;
        if (state_ == State::Running)
        {
            log::info(logcat, "Stop requested; Orchestrator Running -> Stopping");
            state_ = State::Stopping;
        }
    }
    wakeup_.notify_all();
}

bool Orchestrator::waitForNextPoll()
{
    std::unique_lock lk{mutex_};
    return wakeup_.wait_for(lk, pollingInterval_, [this] { return stopRequested_.load(); });
}

void Orchestrator::transitionOnError()
{
    std::lock_guard lk{mutex_};
    auto next = state_ == State::Stopping ? State::Stopped : State::Failed;
    log::info(logcat, "Orchestrator {} -> {}", to_string(state_), to_string(next));
    state_ = next;
}

void Orchestrator::start()
{
    log::info(logcat, "Orchestrator Starting; checking the source ledger");
    try
    {
        scanner_.checkLedger();
    }
    catch (const std::exception& e)
    {
        log::critical(logcat, "Startup failed: {}", e.what());
        transitionOnError();
        throw;
    }
    transition(State::Running);
}

void Orchestrator::run()
{
    if (!stopRequested_)
        start();

    try
    {
        while (!stopRequested_)
        {
            runOnce();
            if (stopRequested_ || waitForNextPoll())
                break;
        }

        transition(State::Stopping);
        transition(State::Stopped);
        log::info(logcat, "Stopped after {} polls: {} batches committed, {} deferred, {} delivered, {} rejected, {} logs skipped",
                stats_.ticks, stats_.batchesCommitted, stats_.batchesDeferred,
                stats_.recordsDelivered, stats_.recordsRejected, stats_.logsSkipped);
    }
    catch (const std::exception& e)
    {
        log::critical(logcat, "Unrecoverable error: {}", e.what());
        transitionOnError();
        throw;
    }
}

bool Orchestrator::runOnce()
{
    ++stats_.ticks;
    auto batch = scanner_.scan();
    if (batch.empty())
        return false;

    stats_.logsSkipped += batch.skippedLogs;
    const auto& range = *batch.range;

    for (const auto& record : batch.records)
    {
        log::debug(logcat, "Submitting nonce {} from tx {} (block {}, log {})",
                record.nonce(), record.transactionHash(), record.blockNumber(), record.logIndex());
        auto outcome = sink_.submit(record);
        switch (outcome.kind)
        {
            case DeliveryOutcome::Kind::Delivered:
                ++stats_.recordsDelivered;
                break;
            case DeliveryOutcome::Kind::RejectedPermanently:
                ++stats_.recordsRejected;
                log::error(logcat, "ALERT: attestation for nonce {} (tx {}, block {}) permanently rejected: {}",
                        record.nonce(), record.transactionHash(), record.blockNumber(), outcome.reason);
                break;
            case DeliveryOutcome::Kind::RetryableFailure:
                ++stats_.batchesDeferred;
                log::warning(logcat, "Attestation service unavailable at nonce {} (tx {}); blocks [{}, {}] will be retried next poll",
                        record.nonce(), record.transactionHash(), range.fromHeight, range.toHeight);
                return false;
        }
    }

    scanner_.commit(batch);
    ++stats_.batchesCommitted;
    return true;
}
}  // namespace bridgewatch
