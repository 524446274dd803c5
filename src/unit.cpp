/**
 * @file unit.cpp
 * @brief Static unit tables.
 */

#include <ut803/measurement.hpp>
#include <ut803/unit.hpp>

#include <array>

namespace ut803 {

namespace {

struct StaticUnit {
    std::uint8_t code;
    std::string_view unit;
};

constexpr std::array<StaticUnit, 10> STATIC_UNITS = {{
    {KIND_DIODE, "V"},
    {KIND_FREQUENCY, "Hz"},
    {KIND_RESISTANCE, "Ohm"},
    {KIND_CONTINUITY, "Ohm"},
    {KIND_CAPACITANCE, "F"},
    {KIND_CURRENT_A, "A"},
    {KIND_VOLTAGE, "V"},
    {KIND_CURRENT_UA, "uA"},
    {KIND_HFE, ""},
    {KIND_CURRENT_MA, "mA"},
}};

struct UnitOffset {
    std::string_view unit;
    int offset;
};

constexpr std::array<UnitOffset, 6> UNIT_OFFSETS = {{
    {"V", -3},
    {"Ohm", -1},
    {"A", -2},
    {"mA", -2},
    {"uA", -1},
    {"F", -3 - 9},
}};

} // namespace

int exponent_offset_for_unit(std::string_view unit) noexcept {
    for (const auto& entry : UNIT_OFFSETS) {
        if (entry.unit == unit) {
            return entry.offset;
        }
    }
    return 0;
}

UnitResolution resolve_unit(std::uint8_t kind_code, const FlagNibbles& flags) noexcept {
    for (const auto& entry : STATIC_UNITS) {
        if (entry.code == kind_code) {
            return {entry.unit, exponent_offset_for_unit(entry.unit)};
        }
    }

    if (kind_code == KIND_TEMPERATURE) {
        if ((flags[0] & FLAG0_NOT_FAHRENHEIT) != 0) {
            return {UNIT_CELSIUS, 0};
        }
        return {UNIT_FAHRENHEIT, 0};
    }

    return {UNKNOWN_UNIT, 0};
}

} // namespace ut803
