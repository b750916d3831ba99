#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "error.hpp"

namespace keyreg {

    /// Bitcoin/Solana base58 alphabet (no 0, O, I, l)
    constexpr const char *BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    /// Encode bytes as base58. Leading zero bytes map to leading '1' characters.
    inline std::string base58Encode(const std::vector<uint8_t> &data) {
        size_t zeros = 0;
        while (zeros < data.size() && data[zeros] == 0) {
            ++zeros;
        }

        // log(256) / log(58), rounded up
        std::vector<uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
        size_t length = 0;
        for (size_t i = zeros; i < data.size(); ++i) {
            int carry = data[i];
            size_t j = 0;
            for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
                carry += 256 * (*it);
                *it = static_cast<uint8_t>(carry % 58);
                carry /= 58;
            }
            length = j;
        }

        auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
        while (it != digits.end() && *it == 0) {
            ++it;
        }

        std::string encoded(zeros, '1');
        encoded.reserve(zeros + static_cast<size_t>(digits.end() - it));
        for (; it != digits.end(); ++it) {
            encoded += BASE58_ALPHABET[*it];
        }
        return encoded;
    }

    /// Decode a base58 string. Fails on characters outside the alphabet.
    inline dp::Result<std::vector<uint8_t>, dp::Error> base58Decode(const std::string &encoded) {
        const std::string alphabet = BASE58_ALPHABET;

        size_t zeros = 0;
        while (zeros < encoded.size() && encoded[zeros] == '1') {
            ++zeros;
        }

        // log(58) / log(256), rounded up
        std::vector<uint8_t> bytes((encoded.size() - zeros) * 733 / 1000 + 1, 0);
        size_t length = 0;
        for (size_t i = zeros; i < encoded.size(); ++i) {
            size_t pos = alphabet.find(encoded[i]);
            if (pos == std::string::npos) {
                return dp::Result<std::vector<uint8_t>, dp::Error>::err(
                    invalid_address("Invalid base58 character in address"));
            }

            int carry = static_cast<int>(pos);
            size_t j = 0;
            for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
                carry += 58 * (*it);
                *it = static_cast<uint8_t>(carry % 256);
                carry /= 256;
            }
            length = j;
        }

        auto it = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
        while (it != bytes.end() && *it == 0) {
            ++it;
        }

        std::vector<uint8_t> decoded(zeros, 0);
        decoded.insert(decoded.end(), it, bytes.end());
        return dp::Result<std::vector<uint8_t>, dp::Error>::ok(decoded);
    }

} // namespace keyreg
