#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gmpxx.h>

namespace bridgewatch::utils
{

    // Size in hex characters of one 32-byte ABI word
    inline constexpr size_t WORD_HEX_SIZE = 64;

    // Size in hex characters of a 20-byte account address
    inline constexpr size_t ADDRESS_HEX_SIZE = 40;

    std::string      decimalToHex(uint64_t decimal, bool prefixed_0x = false);
    std::string_view trimPrefix(std::string_view src, std::string_view prefix);
    std::string_view trimLeadingZeros(std::string_view src);

    uint64_t hexStringToU64(std::string_view hexStr);

    /// Parses an integer of some sort from a string, requiring that the entire string be consumed
    /// during parsing.  Return false if parsing failed, sets `value` and returns true if the entire
    /// string was consumed.
    template <typename T>
    bool parseInt(const std::string_view str, T& value, int base = 10) {
        T tmp;
        auto* strend = str.data() + str.size();
        auto [p, ec] = std::from_chars(str.data(), strend, tmp, base);
        if (ec != std::errc() || p != strend)
            return false;
        value = tmp;
        return true;
    }

    /// True if `address` is "0x" followed by exactly 40 hex digits (either case).
    bool isAddress(std::string_view address);

    /// True if `hash` is "0x" followed by exactly 64 hex digits, the shape of a transaction
    /// hash, block hash or log topic.
    bool isHash32(std::string_view hash);

    /// Lowercases the hex digits of a "0x" prefixed hex string.
    std::string toLowerHex(std::string_view hex);

    /// Splits the hex `data` field of a log (with or without "0x") into its 32-byte words.
    /// Throws std::invalid_argument if the data is not hex or not a whole number of words.
    std::vector<std::string_view> splitWords(std::string_view data);

    /// Extracts the address held in the low 20 bytes of a 32-byte ABI word.  Throws
    /// std::invalid_argument if the word is malformed or the 12 high bytes are not zero.
    std::string wordToAddress(std::string_view word);

    /// Interprets a 32-byte ABI word as an unsigned big-endian integer.
    mpz_class wordToInteger(std::string_view word);

    /// As `wordToInteger`, but throws std::out_of_range if the value does not fit in 64 bits.
    uint64_t wordToU64(std::string_view word);

// END
}
