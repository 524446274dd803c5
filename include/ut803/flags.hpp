/**
 * @file flags.hpp
 * @brief Status flags carried in frame positions 6-8.
 *
 * Bit layout (bit 0 = LSB):
 * - flags[0]: bit0 overload, bit2 sign (negative), bit3 not fahrenheit
 * - flags[1]: bit1 min hold, bit2 max hold, bit3 hold
 * - flags[2]: bit1 autorange, bit2 AC, bit3 DC
 *
 * Bit 1 of flags[0] and bit 0 of flags[1] and flags[2] are reserved.
 */

#ifndef UT803_FLAGS_HPP
#define UT803_FLAGS_HPP

#include "config.hpp"

#include <array>
#include <string>

namespace ut803 {

/// Raw flag nibbles as read from the frame
using FlagNibbles = std::array<std::uint8_t, FLAGS_COUNT>;

/**
 * @defgroup flag_bits Flag Bit Masks
 * @{
 */
inline constexpr std::uint8_t FLAG0_OVERLOAD = 0x1U;
inline constexpr std::uint8_t FLAG0_SIGN = 0x4U;
inline constexpr std::uint8_t FLAG0_NOT_FAHRENHEIT = 0x8U;
inline constexpr std::uint8_t FLAG1_MIN = 0x2U;
inline constexpr std::uint8_t FLAG1_MAX = 0x4U;
inline constexpr std::uint8_t FLAG1_HOLD = 0x8U;
inline constexpr std::uint8_t FLAG2_AUTORANGE = 0x2U;
inline constexpr std::uint8_t FLAG2_AC = 0x4U;
inline constexpr std::uint8_t FLAG2_DC = 0x8U;
/** @} */

/**
 * @brief Decoded status flags.
 */
struct StatusFlags {
    bool overload = false;       ///< Display shows OL
    bool sign = false;           ///< Reading is negative
    bool not_fahrenheit = false; ///< Temperature is in Celsius
    bool min = false;            ///< MIN hold active
    bool max = false;            ///< MAX hold active
    bool hold = false;           ///< Display hold active
    bool autorange = false;      ///< Auto ranging
    bool ac = false;             ///< AC coupling
    bool dc = false;             ///< DC coupling

    bool operator==(const StatusFlags&) const = default;
};

/// Number of named flags
inline constexpr std::size_t FLAG_COUNT = 9U;

/**
 * @brief Decode the three flag nibbles.
 */
StatusFlags flags_from_nibbles(const FlagNibbles& nibbles) noexcept;

/**
 * @brief Flag names in reporting order.
 *
 * overload, sign, not_fahrenheit, min, max, hold, autorange, ac, dc
 */
const std::array<const char*, FLAG_COUNT>& flag_names() noexcept;

/**
 * @brief Flag values in the same order as flag_names().
 */
std::array<bool, FLAG_COUNT> flag_values(const StatusFlags& flags) noexcept;

/**
 * @brief Join the names of all set flags.
 *
 * @param flags Decoded flags
 * @param separator Text placed between names
 * @return e.g. "overload, autorange" for separator ", "; empty if none set
 */
std::string active_flag_names(const StatusFlags& flags, const char* separator);

} // namespace ut803

#endif // UT803_FLAGS_HPP
