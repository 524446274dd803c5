/**
 * @file unit.hpp
 * @brief Unit and exponent resolution.
 *
 * The four magnitude digits are a raw display count. The unit and a
 * per-unit exponent offset turn that count into a physical value:
 *
 * | unit | offset | note                          |
 * |------|--------|-------------------------------|
 * | V    | -3     |                               |
 * | Ohm  | -1     |                               |
 * | A    | -2     |                               |
 * | mA   | -2     |                               |
 * | uA   | -1     |                               |
 * | F    | -12    | count is in picofarad scale   |
 *
 * Every other unit has offset 0.
 */

#ifndef UT803_UNIT_HPP
#define UT803_UNIT_HPP

#include "config.hpp"
#include "flags.hpp"

#include <string_view>

namespace ut803 {

/// Unit reported for combinations the table does not cover
inline constexpr std::string_view UNKNOWN_UNIT = "???";

inline constexpr std::string_view UNIT_VOLT = "V";
inline constexpr std::string_view UNIT_CELSIUS = "\xC2\xB0" "C";
inline constexpr std::string_view UNIT_FAHRENHEIT = "\xC2\xB0" "F";

/**
 * @brief Result of unit resolution.
 */
struct UnitResolution {
    std::string_view unit; ///< Display unit, points at static storage
    int exponent_offset;   ///< Added to the frame's exponent nibble
};

/**
 * @brief Exponent offset for a unit string.
 *
 * @return Offset from the table above, 0 for any other unit
 */
int exponent_offset_for_unit(std::string_view unit) noexcept;

/**
 * @brief Resolve unit and exponent offset for a raw kind code.
 *
 * Takes the raw code rather than MeasurementKind since codes 9, 13 and 15
 * are all current but read in A, uA and mA. Temperature picks Celsius when
 * the not-fahrenheit bit of flags[0] is set. Unassigned codes resolve to
 * UNKNOWN_UNIT with offset 0; this never fails.
 *
 * @param kind_code Nibble from frame position 5
 * @param flags Raw flag nibbles
 */
UnitResolution resolve_unit(std::uint8_t kind_code, const FlagNibbles& flags) noexcept;

} // namespace ut803

#endif // UT803_UNIT_HPP
