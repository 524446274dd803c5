/**
 * @file frame_decoder.hpp
 * @brief UT803 frame decoding.
 *
 * Frame layout (11 characters):
 *
 *     index  0    1-4      5     6-8     9-10
 *            exp  digits   kind  flags   "\r\n"
 *
 * exp, kind and flags are nibbles ('0' + value). digits is the unsigned
 * display count 0000-9999. The decoded value is
 *
 *     value = digits * 10^(exp' + offset(unit)),  negated if the sign flag is set
 *
 * where exp' = exp - 2 when the unit is "V" and bit 2 of exp is set.
 */

#ifndef UT803_FRAME_DECODER_HPP
#define UT803_FRAME_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "flags.hpp"
#include "measurement.hpp"

#include <string>
#include <string_view>

namespace ut803 {

/**
 * @brief One decoded measurement.
 */
struct Reading {
    double value = 0.0;                             ///< Value in unit
    std::string unit;                               ///< Display unit ("V", "mA", "°C", ...)
    MeasurementKind kind = MeasurementKind::Unknown;
    std::uint8_t kind_code = 0;                     ///< Raw kind nibble (keeps A/uA/mA apart)
    StatusFlags flags;
};

/**
 * @brief Where a frame failed to decode.
 */
struct DecodeFailure {
    std::size_t position = 0;   ///< Frame index of the bad character (InvalidDigit)
    std::uint8_t kind_code = 0; ///< Unassigned kind code (UnknownMeasurementKind)
};

/**
 * @brief Scale a display count by a power of ten.
 *
 * Multiplies or divides by an exactly representable power of ten so the
 * result is the correctly rounded double of base * 10^exponent.
 */
double scale_magnitude(std::uint32_t base, int exponent) noexcept;

/**
 * @brief Decode one frame.
 *
 * Stateless; the same frame always gives the same reading. Characters 9
 * and 10 are not inspected.
 *
 * @param frame Exactly FRAME_LENGTH characters
 * @param[out] out Decoded reading, untouched on error
 * @param[out] failure Optional failure detail
 * @return Error::Ok, Error::BadLength, Error::InvalidDigit or
 *         Error::UnknownMeasurementKind
 */
Error decode_frame(std::string_view frame, Reading& out, DecodeFailure* failure = nullptr) noexcept;

#if !UT803_NO_EXCEPTIONS
/**
 * @brief Decode one frame, throwing on malformed input.
 *
 * @throws DecodeException with the error code and failure detail
 */
Reading decode_frame(std::string_view frame);
#endif

} // namespace ut803

#endif // UT803_FRAME_DECODER_HPP
