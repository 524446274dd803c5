/**
 * @file frame_decoder.cpp
 * @brief Frame decoding.
 */

#include <ut803/frame_decoder.hpp>
#include <ut803/nibble.hpp>
#include <ut803/unit.hpp>

#include <array>

namespace ut803 {

namespace {

// 10^0 .. 10^22 are exact doubles.
constexpr std::array<double, 23> POW10 = {
    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,  1e10, 1e11,
    1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19, 1e20, 1e21, 1e22};

constexpr int MAX_EXACT_POW10 = static_cast<int>(POW10.size()) - 1;

Error fail_at(DecodeFailure* failure, std::size_t position) noexcept {
    if (failure != nullptr) {
        failure->position = position;
    }
    return Error::InvalidDigit;
}

} // namespace

double scale_magnitude(std::uint32_t base, int exponent) noexcept {
    double value = static_cast<double>(base);

    while (exponent > MAX_EXACT_POW10) {
        value *= POW10[MAX_EXACT_POW10];
        exponent -= MAX_EXACT_POW10;
    }
    while (exponent < -MAX_EXACT_POW10) {
        value /= POW10[MAX_EXACT_POW10];
        exponent += MAX_EXACT_POW10;
    }

    if (exponent >= 0) {
        return value * POW10[static_cast<std::size_t>(exponent)];
    }
    return value / POW10[static_cast<std::size_t>(-exponent)];
}

Error decode_frame(std::string_view frame, Reading& out, DecodeFailure* failure) noexcept {
    if (frame.size() != FRAME_LENGTH) {
        return Error::BadLength;
    }

    std::uint8_t exponent_nibble = 0;
    if (nibble_decode(frame[EXPONENT_POS], exponent_nibble) != Error::Ok) {
        return fail_at(failure, EXPONENT_POS);
    }

    std::uint32_t base = 0;
    std::size_t bad_index = 0;
    if (decimal_decode(frame.data() + DIGITS_POS, DIGITS_COUNT, base, bad_index) != Error::Ok) {
        return fail_at(failure, DIGITS_POS + bad_index);
    }

    std::uint8_t kind_code = 0;
    if (nibble_decode(frame[KIND_POS], kind_code) != Error::Ok) {
        return fail_at(failure, KIND_POS);
    }

    FlagNibbles nibbles{};
    for (std::size_t i = 0; i < FLAGS_COUNT; ++i) {
        if (nibble_decode(frame[FLAGS_POS + i], nibbles[i]) != Error::Ok) {
            return fail_at(failure, FLAGS_POS + i);
        }
    }

    MeasurementKind kind = MeasurementKind::Unknown;
    if (kind_from_code(kind_code, kind) != Error::Ok) {
        if (failure != nullptr) {
            failure->position = KIND_POS;
            failure->kind_code = kind_code;
        }
        return Error::UnknownMeasurementKind;
    }

    const StatusFlags flags = flags_from_nibbles(nibbles);
    const UnitResolution resolved = resolve_unit(kind_code, nibbles);

    // Voltage ranges shift the decimal point by two when bit 2 is set.
    // Diode mode reports "V" too and gets the same shift.
    int exponent = exponent_nibble;
    if (resolved.unit == UNIT_VOLT && (exponent_nibble & 0x4U) != 0) {
        exponent -= 2;
    }
    exponent += resolved.exponent_offset;

    double value = scale_magnitude(base, exponent);
    if (flags.sign) {
        value = -value;
    }

    out.value = value;
    out.unit.assign(resolved.unit.data(), resolved.unit.size());
    out.kind = kind;
    out.kind_code = kind_code;
    out.flags = flags;
    return Error::Ok;
}

#if !UT803_NO_EXCEPTIONS
Reading decode_frame(std::string_view frame) {
    Reading reading;
    DecodeFailure failure;
    Error result = decode_frame(frame, reading, &failure);
    if (result != Error::Ok) {
        std::string message = error_string(result);
        if (result == Error::InvalidDigit) {
            message += " at position " + std::to_string(failure.position);
        } else if (result == Error::UnknownMeasurementKind) {
            message += " " + std::to_string(failure.kind_code);
        } else if (result == Error::BadLength) {
            message += " " + std::to_string(frame.size());
        }
        throw DecodeException(message, result, failure.position, failure.kind_code);
    }
    return reading;
}
#endif

} // namespace ut803
