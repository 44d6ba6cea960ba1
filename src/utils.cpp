#include "bridgewatch/utils.hpp"

#include <oxenc/hex.h>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

namespace bridgewatch
{
std::string utils::decimalToHex(uint64_t decimal, bool prefixed_0x) {
    char buf[22];
    if (prefixed_0x) {
        buf[0] = '0';
        buf[1] = 'x';
    }

    auto [end, ec] = std::to_chars(std::begin(buf) + 2 * prefixed_0x, std::end(buf), decimal, 16);
    return {buf, ec == std::errc{} ? static_cast<size_t>(end - buf) : 0};
}

std::string_view utils::trimPrefix(std::string_view src, std::string_view prefix) {
    if (src.starts_with(prefix))
        return src.substr(prefix.size());
    return src;
}

std::string_view utils::trimLeadingZeros(std::string_view src) {
    if (auto p = src.find_first_not_of('0'); p != src.npos)
        return src.substr(p);
    return src;
}

uint64_t utils::hexStringToU64(std::string_view hexStr) {
    uint64_t val;
    if (parseInt(trimPrefix(hexStr, "0x"), val, 16))
        return val;

    throw std::invalid_argument{"failed to parse integer from hex input"};
}

static bool isPrefixedHexOfSize(std::string_view value, size_t hex_size) {
    if (!value.starts_with("0x") && !value.starts_with("0X"))
        return false;
    value.remove_prefix(2);
    return value.size() == hex_size && oxenc::is_hex(value);
}

bool utils::isAddress(std::string_view address) {
    return isPrefixedHexOfSize(address, ADDRESS_HEX_SIZE);
}

bool utils::isHash32(std::string_view hash) {
    return isPrefixedHexOfSize(hash, WORD_HEX_SIZE);
}

std::string utils::toLowerHex(std::string_view hex) {
    std::string out{hex};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::vector<std::string_view> utils::splitWords(std::string_view data) {
    data = trimPrefix(data, "0x");
    if (!oxenc::is_hex(data))
        throw std::invalid_argument{"log data is not hex"};
    if (data.size() % WORD_HEX_SIZE != 0)
        throw std::invalid_argument{"log data is not a whole number of 32-byte words"};

    std::vector<std::string_view> words;
    words.reserve(data.size() / WORD_HEX_SIZE);
    for (size_t i = 0; i < data.size(); i += WORD_HEX_SIZE)
        words.push_back(data.substr(i, WORD_HEX_SIZE));
    return words;
}

static std::string_view checkedWord(std::string_view word) {
    word = utils::trimPrefix(word, "0x");
    if (word.size() != utils::WORD_HEX_SIZE || !oxenc::is_hex(word))
        throw std::invalid_argument{"expected a 32-byte hex word"};
    return word;
}

std::string utils::wordToAddress(std::string_view word) {
    word = checkedWord(word);
    auto high = word.substr(0, WORD_HEX_SIZE - ADDRESS_HEX_SIZE);
    if (high.find_first_not_of('0') != std::string_view::npos)
        throw std::invalid_argument{"address word has non-zero high bytes"};
    return "0x" + toLowerHex(word.substr(WORD_HEX_SIZE - ADDRESS_HEX_SIZE));
}

mpz_class utils::wordToInteger(std::string_view word) {
    word = checkedWord(word);
    mpz_class value;
    // mpz_class::set_str returns -1 on invalid input; checkedWord has already validated the hex
    if (value.set_str(std::string{word}, 16) != 0)
        throw std::invalid_argument{"failed to parse 256-bit integer from word"};
    return value;
}

uint64_t utils::wordToU64(std::string_view word) {
    auto digits = checkedWord(word);
    if (digits.find_first_not_of('0') == std::string_view::npos)
        return 0;
    digits = trimLeadingZeros(digits);
    if (digits.size() > 16)
        throw std::out_of_range{"256-bit word does not fit into 64 bits"};
    return hexStringToU64(digits);
}
};  // namespace bridgewatch
