/**
 * @file measurement.cpp
 * @brief Kind code table.
 */

#include <ut803/measurement.hpp>

#include <array>

namespace ut803 {

namespace {

struct KindEntry {
    bool assigned;
    MeasurementKind kind;
};

constexpr KindEntry UNASSIGNED{false, MeasurementKind::Unknown};

// Indexed by raw code 0-15.
constexpr std::array<KindEntry, 16> KIND_TABLE = {{
    UNASSIGNED,                             // 0
    {true, MeasurementKind::Diode},         // 1
    {true, MeasurementKind::Frequency},     // 2
    {true, MeasurementKind::Resistance},    // 3
    {true, MeasurementKind::Temperature},   // 4
    {true, MeasurementKind::Continuity},    // 5
    {true, MeasurementKind::Capacitance},   // 6
    UNASSIGNED,                             // 7
    UNASSIGNED,                             // 8
    {true, MeasurementKind::Current},       // 9  A
    UNASSIGNED,                             // 10
    {true, MeasurementKind::Voltage},       // 11
    UNASSIGNED,                             // 12
    {true, MeasurementKind::Current},       // 13 uA
    {true, MeasurementKind::HFE},           // 14
    {true, MeasurementKind::Current},       // 15 mA
}};

} // namespace

Error kind_from_code(std::uint8_t code, MeasurementKind& kind) noexcept {
    if (code >= KIND_TABLE.size() || !KIND_TABLE[code].assigned) {
        return Error::UnknownMeasurementKind;
    }
    kind = KIND_TABLE[code].kind;
    return Error::Ok;
}

const char* kind_name(MeasurementKind kind) noexcept {
    switch (kind) {
    case MeasurementKind::Diode:
        return "diode";
    case MeasurementKind::Frequency:
        return "frequency";
    case MeasurementKind::Resistance:
        return "resistance";
    case MeasurementKind::Temperature:
        return "temperature";
    case MeasurementKind::Continuity:
        return "continuity";
    case MeasurementKind::Capacitance:
        return "capacitance";
    case MeasurementKind::Current:
        return "current";
    case MeasurementKind::Voltage:
        return "voltage";
    case MeasurementKind::HFE:
        return "hFE";
    case MeasurementKind::Unknown:
    default:
        return "unknown";
    }
}

} // namespace ut803
