/**
 * @file measurement.hpp
 * @brief Measurement kinds reported by the UT803.
 *
 * The meter reports its rotary switch position as a nibble at frame
 * position 5. The code set is sparse and three codes (9, 13, 15) all mean
 * current on different ranges, so the raw code is kept next to the kind.
 */

#ifndef UT803_MEASUREMENT_HPP
#define UT803_MEASUREMENT_HPP

#include "config.hpp"
#include "error.hpp"

namespace ut803 {

/**
 * @brief What the meter is measuring.
 */
enum class MeasurementKind : std::uint8_t {
    Diode,
    Frequency,
    Resistance,
    Temperature,
    Continuity,
    Capacitance,
    Current,
    Voltage,
    HFE,
    Unknown
};

/**
 * @defgroup kind_codes Raw Kind Codes
 * @{
 */
inline constexpr std::uint8_t KIND_DIODE = 1U;
inline constexpr std::uint8_t KIND_FREQUENCY = 2U;
inline constexpr std::uint8_t KIND_RESISTANCE = 3U;
inline constexpr std::uint8_t KIND_TEMPERATURE = 4U;
inline constexpr std::uint8_t KIND_CONTINUITY = 5U;
inline constexpr std::uint8_t KIND_CAPACITANCE = 6U;
inline constexpr std::uint8_t KIND_CURRENT_A = 9U;
inline constexpr std::uint8_t KIND_VOLTAGE = 11U;
inline constexpr std::uint8_t KIND_CURRENT_UA = 13U;
inline constexpr std::uint8_t KIND_HFE = 14U;
inline constexpr std::uint8_t KIND_CURRENT_MA = 15U;
/** @} */

/**
 * @brief Map a raw kind code to its measurement kind.
 *
 * @param code Nibble from frame position 5
 * @param[out] kind Measurement kind, untouched on error
 * @return Error::Ok, or Error::UnknownMeasurementKind for unassigned codes
 */
Error kind_from_code(std::uint8_t code, MeasurementKind& kind) noexcept;

/**
 * @brief Name used in recorder headers and the monitor line.
 *
 * @return "diode", "frequency", ..., "hFE", or "unknown"
 */
const char* kind_name(MeasurementKind kind) noexcept;

} // namespace ut803

#endif // UT803_MEASUREMENT_HPP
