// orchestrator.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string_view>

#include "attestation_sink.hpp"
#include "scanner.hpp"

namespace bridgewatch
{
struct OrchestratorStats {
    uint64_t ticks = 0;
    uint64_t batchesCommitted = 0;
    uint64_t batchesDeferred = 0;
    uint64_t recordsDelivered = 0;
    uint64_t recordsRejected = 0;
    uint64_t logsSkipped = 0;
};

/// Drives the scan-then-submit cycle on a fixed polling interval.
///
/// State moves Starting -> Running -> Stopping -> Stopped, or to Failed from Starting or Running
/// when the scanner reports something unrecoverable.  A stop request never interrupts a batch:
/// every record of the current batch is submitted before the loop exits.
class Orchestrator {
public:
    enum class State {
        Starting,
        Running,
        Stopping,
        Stopped,
        Failed,
    };

    Orchestrator(EventScanner& scanner, AttestationSink& sink, std::chrono::milliseconds pollingInterval);

    /// Checks ledger connectivity, then moves Starting -> Running.  An unreachable ledger is only
    /// logged since scans keep retrying; LedgerFatal moves to Failed and is rethrown.
    void start();

    /// Calls start(), then runs until requestStop() is called or a fatal error occurs.  Fatal
    /// errors are rethrown after the transition to Failed, or to Stopped when a stop was already
    /// under way.
    void run();

    /// Performs one scan and submits its records in order.  Returns true if the batch was fully
    /// resolved and committed.
    bool runOnce();

    /// Safe to call from any thread, including a signal watcher.  Wakes a sleeping poll loop.
    void requestStop();

    State state() const;
    const OrchestratorStats& stats() const { return stats_; }

private:
    void transition(State next);
    // Failed is only entered from Starting or Running; an error while stopping still ends Stopped
    void transitionOnError();
    // Sleeps for the polling interval; returns early (true) when a stop is requested.
    bool waitForNextPoll();

    EventScanner& scanner_;
    AttestationSink& sink_;
    std::chrono::milliseconds pollingInterval_;
    OrchestratorStats stats_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::atomic<bool> stopRequested_{false};
    State state_{State::Starting};
};

std::string_view to_string(Orchestrator::State state);
}  // namespace bridgewatch
