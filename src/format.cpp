/**
 * @file format.cpp
 * @brief Text rendering of readings.
 */

#include <ut803/format.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace ut803 {

namespace {

struct Prefix {
    double below;
    double scale;
    const char* prefix;
};

constexpr Prefix PREFIXES[] = {
    {1e-9, 1e12, "p"},
    {1e-6, 1e9, "n"},
    {1e-3, 1e6, "u"},
    {1.0, 1e3, "m"},
    {1e3, 1.0, ""},
    {1e6, 1e-3, "k"},
};

} // namespace

PrefixedValue prefix_scale(double value, std::string_view unit) {
    if (value == 0.0) {
        return {value, std::string(unit)};
    }

    double magnitude = std::fabs(value);
    for (const auto& p : PREFIXES) {
        if (magnitude < p.below) {
            return {value * p.scale, p.prefix + std::string(unit)};
        }
    }
    return {value * 1e-6, "M" + std::string(unit)};
}

std::string format_value(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    std::string out = std::signbit(value) ? "-" : "";
    if (value == 0.0) {
        return out + "0.0";
    }

    // Shortest scientific form "d.ddde+XX" gives the significant digits.
    char buf[32];
    auto result = std::to_chars(buf, buf + sizeof(buf), std::fabs(value),
                                std::chars_format::scientific);
    std::string_view sci(buf, static_cast<std::size_t>(result.ptr - buf));

    std::size_t e_pos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') {
            digits += c;
        }
    }
    int exponent = std::atoi(std::string(sci.substr(e_pos + 1)).c_str());
    int n = static_cast<int>(digits.size());

    if (exponent >= -4 && exponent < 16) {
        if (exponent >= n - 1) {
            out += digits;
            out.append(static_cast<std::size_t>(exponent - (n - 1)), '0');
            out += ".0";
        } else if (exponent >= 0) {
            out += digits.substr(0, static_cast<std::size_t>(exponent + 1));
            out += '.';
            out += digits.substr(static_cast<std::size_t>(exponent + 1));
        } else {
            out += "0.";
            out.append(static_cast<std::size_t>(-exponent - 1), '0');
            out += digits;
        }
        return out;
    }

    out += digits[0];
    if (n > 1) {
        out += '.';
        out += digits.substr(1);
    }
    char exp_buf[8];
    std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+',
                  std::abs(exponent));
    out += exp_buf;
    return out;
}

std::string monitor_line(const Reading& reading) {
    PrefixedValue pretty = prefix_scale(reading.value, reading.unit);

    char value_buf[64];
    std::snprintf(value_buf, sizeof(value_buf), "%.2f", pretty.value);

    std::string line = "\r\033[0K";
    line += kind_name(reading.kind);
    line += ": ";
    line += value_buf;
    line += ' ';
    line += pretty.unit;
    line += ", flags: ";
    line += active_flag_names(reading.flags, " ");
    return line;
}

} // namespace ut803
