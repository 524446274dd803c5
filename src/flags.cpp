/**
 * @file flags.cpp
 * @brief Status flag decoding and naming.
 */

#include <ut803/flags.hpp>

namespace ut803 {

StatusFlags flags_from_nibbles(const FlagNibbles& nibbles) noexcept {
    StatusFlags flags;
    flags.overload = (nibbles[0] & FLAG0_OVERLOAD) != 0;
    flags.sign = (nibbles[0] & FLAG0_SIGN) != 0;
    flags.not_fahrenheit = (nibbles[0] & FLAG0_NOT_FAHRENHEIT) != 0;

    flags.min = (nibbles[1] & FLAG1_MIN) != 0;
    flags.max = (nibbles[1] & FLAG1_MAX) != 0;
    flags.hold = (nibbles[1] & FLAG1_HOLD) != 0;

    flags.autorange = (nibbles[2] & FLAG2_AUTORANGE) != 0;
    flags.ac = (nibbles[2] & FLAG2_AC) != 0;
    flags.dc = (nibbles[2] & FLAG2_DC) != 0;
    return flags;
}

const std::array<const char*, FLAG_COUNT>& flag_names() noexcept {
    static const std::array<const char*, FLAG_COUNT> names = {
        "overload", "sign", "not_fahrenheit", "min", "max", "hold", "autorange", "ac", "dc"};
    return names;
}

std::array<bool, FLAG_COUNT> flag_values(const StatusFlags& flags) noexcept {
    return {flags.overload, flags.sign, flags.not_fahrenheit, flags.min,  flags.max,
            flags.hold,     flags.autorange, flags.ac,        flags.dc};
}

std::string active_flag_names(const StatusFlags& flags, const char* separator) {
    const auto& names = flag_names();
    const auto values = flag_values(flags);

    std::string out;
    for (std::size_t i = 0; i < FLAG_COUNT; ++i) {
        if (!values[i]) {
            continue;
        }
        if (!out.empty()) {
            out += separator;
        }
        out += names[i];
    }
    return out;
}

} // namespace ut803
