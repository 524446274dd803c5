/**
 * @file nibble.hpp
 * @brief Digit decoding for UT803 frames.
 *
 * The meter encodes 4-bit values as ASCII '0' + value, so the sixteen
 * valid characters are 0123456789:;<=>? . The magnitude field uses plain
 * decimal digits only.
 */

#ifndef UT803_NIBBLE_HPP
#define UT803_NIBBLE_HPP

#include "config.hpp"
#include "error.hpp"

namespace ut803 {

/**
 * @brief Decode one nibble character.
 *
 * @param c Frame character
 * @param[out] value Nibble value 0-15, untouched on error
 * @return Error::Ok, or Error::InvalidDigit outside '0'..'?'
 */
inline Error nibble_decode(char c, std::uint8_t& value) noexcept {
    int num = static_cast<unsigned char>(c) - '0';
    if (num < 0 || num > 15) [[unlikely]] {
        return Error::InvalidDigit;
    }
    value = static_cast<std::uint8_t>(num);
    return Error::Ok;
}

/**
 * @brief Encode a nibble as a frame character.
 *
 * @param value Nibble value (only the low 4 bits are used)
 * @return Character '0'..'?'
 */
[[nodiscard]] constexpr char nibble_encode(std::uint8_t value) noexcept {
    return static_cast<char>('0' + (value & 0x0FU));
}

/**
 * @brief Parse an unsigned decimal field.
 *
 * @param data Field characters
 * @param count Number of characters (at most 9)
 * @param[out] value Parsed value
 * @param[out] bad_index Index of the first non-digit, set on error
 * @return Error::Ok, or Error::InvalidDigit on a non-digit character
 */
inline Error decimal_decode(const char* data, std::size_t count, std::uint32_t& value,
                            std::size_t& bad_index) noexcept {
    std::uint32_t result = 0;
    for (std::size_t i = 0; i < count; ++i) {
        char c = data[i];
        if (c < '0' || c > '9') {
            bad_index = i;
            return Error::InvalidDigit;
        }
        result = result * 10U + static_cast<std::uint32_t>(c - '0');
    }
    value = result;
    return Error::Ok;
}

} // namespace ut803

#endif // UT803_NIBBLE_HPP
