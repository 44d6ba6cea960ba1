#include "bridgewatch/event_record.hpp"
#include "bridgewatch/errors.hpp"
#include "bridgewatch/utils.hpp"

#include <stdexcept>

namespace bridgewatch
{
namespace
{
// topics: selector, sender, recipient, destinationChainId
constexpr size_t TRANSFER_TOPIC_COUNT = 4;
// data: token, amount, nonce
constexpr size_t TRANSFER_DATA_WORDS = 3;

const char* const DATA_FIELD_NAMES[TRANSFER_DATA_WORDS] = {"token", "amount", "nonce"};

void requireAddress(const std::string& value, std::string_view field)
{
    if (value.empty() || !utils::isAddress(value))
        throw DecodingError{"Field " + std::string{field} + " is not an address: \"" + value + "\""};
}
}  // namespace

EventRecord::EventRecord(std::string fromAddress,
                         std::string toAddress,
                         std::string token,
                         mpz_class amount,
                         uint64_t sourceChainId,
                         uint64_t destinationChainId,
                         uint64_t nonce,
                         std::string transactionHash,
                         uint64_t blockNumber,
                         uint32_t logIndex)
    : fromAddress_(std::move(fromAddress)),
      toAddress_(std::move(toAddress)),
      token_(std::move(token)),
      amount_(std::move(amount)),
      sourceChainId_(sourceChainId),
      destinationChainId_(destinationChainId),
      nonce_(nonce),
      transactionHash_(std::move(transactionHash)),
      blockNumber_(blockNumber),
      logIndex_(logIndex)
{
    requireAddress(fromAddress_, "from");
    requireAddress(toAddress_, "to");
    requireAddress(token_, "token");
    if (sgn(amount_) < 0)
        throw DecodingError{"Field amount is negative"};
    if (!utils::isHash32(transactionHash_))
        throw DecodingError{"Field transactionHash is malformed: \"" + transactionHash_ + "\""};
}

bool EventRecord::operator==(const EventRecord& other) const
{
    return fromAddress_ == other.fromAddress_
        && toAddress_ == other.toAddress_
        && token_ == other.token_
        && amount_ == other.amount_
        && sourceChainId_ == other.sourceChainId_
        && destinationChainId_ == other.destinationChainId_
        && nonce_ == other.nonce_
        && transactionHash_ == other.transactionHash_
        && blockNumber_ == other.blockNumber_
        && logIndex_ == other.logIndex_;
}

EventRecord decodeTransferLog(const LogEntry& log, uint64_t sourceChainId)
{
    if (log.parseError)
        throw DecodingError{"Log entry is malformed: " + *log.parseError};
    if (!log.transactionHash)
        throw DecodingError{"Log is missing transactionHash"};
    if (!log.blockNumber)
        throw DecodingError{"Log is missing blockNumber"};
    if (!log.logIndex)
        throw DecodingError{"Log is missing logIndex"};
    if (log.topics.size() < TRANSFER_TOPIC_COUNT)
        throw DecodingError{"Log has " + std::to_string(log.topics.size()) + " topics, expected "
                + std::to_string(TRANSFER_TOPIC_COUNT)};

    std::vector<std::string_view> words;
    try
    {
        words = utils::splitWords(log.data);
    }
    catch (const std::exception& e)
    {
        throw DecodingError{std::string{"Log data is malformed: "} + e.what()};
    }
    if (words.size() < TRANSFER_DATA_WORDS)
        throw DecodingError{"Log data is missing field " + std::string{DATA_FIELD_NAMES[words.size()]}};

    try
    {
        return EventRecord{
            utils::wordToAddress(log.topics[1]),
            utils::wordToAddress(log.topics[2]),
            utils::wordToAddress(words[0]),
            utils::wordToInteger(words[1]),
            sourceChainId,
            utils::wordToU64(log.topics[3]),
            utils::wordToU64(words[2]),
            utils::toLowerHex(*log.transactionHash),
            *log.blockNumber,
            *log.logIndex};
    }
    catch (const DecodingError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw DecodingError{std::string{"Log field is malformed: "} + e.what()};
    }
}
}  // namespace bridgewatch
