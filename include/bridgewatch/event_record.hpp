// event_record.hpp
#pragma once

#include <cstdint>
#include <string>
#include <tuple>

#include <gmpxx.h>

#include "logs.hpp"

namespace bridgewatch
{
/// A bridge transfer initiated on the source chain, normalized away from the ledger's log
/// format.  Records are validated on construction and never change afterwards.
class EventRecord {
public:
    /// Throws DecodingError if an address is not address-shaped, the transaction hash is not
    /// a 32-byte hex string or the amount is negative.
    EventRecord(std::string fromAddress,
                std::string toAddress,
                std::string token,
                mpz_class amount,
                uint64_t sourceChainId,
                uint64_t destinationChainId,
                uint64_t nonce,
                std::string transactionHash,
                uint64_t blockNumber,
                uint32_t logIndex);

    const std::string& fromAddress() const { return fromAddress_; }
    const std::string& toAddress() const { return toAddress_; }
    const std::string& token() const { return token_; }
    const mpz_class& amount() const { return amount_; }
    uint64_t sourceChainId() const { return sourceChainId_; }
    uint64_t destinationChainId() const { return destinationChainId_; }
    uint64_t nonce() const { return nonce_; }
    const std::string& transactionHash() const { return transactionHash_; }
    uint64_t blockNumber() const { return blockNumber_; }
    uint32_t logIndex() const { return logIndex_; }

    /// Canonical processing order.
    std::tuple<uint64_t, uint32_t> orderKey() const { return {blockNumber_, logIndex_}; }

    /// Discovery-layer identity of the log this record came from.
    std::tuple<std::string, uint32_t> logKey() const { return {transactionHash_, logIndex_}; }

    bool operator==(const EventRecord& other) const;

private:
    std::string fromAddress_;
    std::string toAddress_;
    std::string token_;
    mpz_class amount_;
    uint64_t sourceChainId_;
    uint64_t destinationChainId_;
    uint64_t nonce_;
    std::string transactionHash_;
    uint64_t blockNumber_;
    uint32_t logIndex_;
};

/// Orders records by (blockNumber, logIndex).
inline bool canonicalOrder(const EventRecord& a, const EventRecord& b) {
    return a.orderKey() < b.orderKey();
}

/// Decodes a `BridgeTransferInitiated(address indexed sender, address indexed recipient,
/// uint256 indexed destinationChainId, address token, uint256 amount, uint256 nonce)` log.
///
/// Expects four topics (selector, sender, recipient, destination chain id) and three data words
/// (token, amount, nonce).  A log missing any field, or carrying a value that does not fit its
/// field, throws DecodingError; a partial record is never produced.
EventRecord decodeTransferLog(const LogEntry& log, uint64_t sourceChainId);
}  // namespace bridgewatch
