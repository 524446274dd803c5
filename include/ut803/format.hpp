/**
 * @file format.hpp
 * @brief Text rendering of readings.
 */

#ifndef UT803_FORMAT_HPP
#define UT803_FORMAT_HPP

#include "frame_decoder.hpp"

#include <string>
#include <string_view>

namespace ut803 {

/**
 * @brief Value rescaled to an SI prefix.
 */
struct PrefixedValue {
    double value;     ///< Scaled value
    std::string unit; ///< Prefix followed by the unit
};

/**
 * @brief Pick an SI prefix by magnitude.
 *
 * | magnitude    | prefix | scale |
 * |--------------|--------|-------|
 * | 0            | none   | 1     |
 * | < 1e-9       | p      | 1e12  |
 * | < 1e-6       | n      | 1e9   |
 * | < 1e-3       | u      | 1e6   |
 * | < 1          | m      | 1e3   |
 * | < 1e3        | none   | 1     |
 * | < 1e6        | k      | 1e-3  |
 * | otherwise    | M      | 1e-6  |
 *
 * Negative values use the magnitude and keep their sign.
 */
PrefixedValue prefix_scale(double value, std::string_view unit);

/**
 * @brief Shortest round-trip text of a double.
 *
 * Fixed notation for decimal exponents -4..15, scientific otherwise;
 * integral values keep a trailing ".0". Examples: "1234.0", "123.4",
 * "0.0001", "5e-09", "-0.0".
 */
std::string format_value(double value);

/**
 * @brief Live status line for a terminal.
 *
 * Starts with "\r\033[0K" so each call overwrites the previous line:
 * "voltage: 123.40 V, flags: autorange dc"
 */
std::string monitor_line(const Reading& reading);

} // namespace ut803

#endif // UT803_FORMAT_HPP
