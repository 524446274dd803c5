/**
 * @file test_frame_decoder.cpp
 * @brief Unit tests for frame decoding.
 */

#include <ut803/frame_decoder.hpp>
#include <ut803/unit.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ut803;

static Reading decode_ok(const std::string& frame) {
    Reading reading;
    DecodeFailure failure;
    REQUIRE(decode_frame(frame, reading, &failure) == Error::Ok);
    return reading;
}

// ============================================================================
// Value scaling
// ============================================================================

TEST_CASE("Scale magnitude is exact", "[decoder][scale]") {
    REQUIRE(scale_magnitude(1234, -1) == 123.4);
    REQUIRE(scale_magnitude(3, -1) == 0.3);
    REQUIRE(scale_magnitude(5000, -12) == 5e-9);
    REQUIRE(scale_magnitude(1, -14) == 1e-14);
    REQUIRE(scale_magnitude(9999, -14) == 9.999e-11);
    REQUIRE(scale_magnitude(1234, 0) == 1234.0);
    REQUIRE(scale_magnitude(9999, 15) == 9.999e18);
    REQUIRE(scale_magnitude(0, -12) == 0.0);
    REQUIRE(scale_magnitude(0, 15) == 0.0);
}

TEST_CASE("Scale magnitude beyond the exact power table", "[decoder][scale]") {
    REQUIRE(scale_magnitude(1, 30) == 1e30);
    REQUIRE(scale_magnitude(1, 22) == 1e22);
}

// ============================================================================
// Measurement kinds
// ============================================================================

TEST_CASE("Voltage with range shift", "[decoder]") {
    // e0 = 4 has bit 2 set: exponent = (4 - 2) - 3 = -1
    Reading r = decode_ok("41234;03:\r\n");
    REQUIRE(r.value == 123.4);
    REQUIRE(r.unit == "V");
    REQUIRE(r.kind == MeasurementKind::Voltage);
    REQUIRE(r.kind_code == 11);
    REQUIRE(r.flags.min);
    REQUIRE(r.flags.autorange);
    REQUIRE(r.flags.dc);
    REQUIRE_FALSE(r.flags.sign);
}

TEST_CASE("Voltage without range shift", "[decoder]") {
    SECTION("e0 = 3, bit 2 clear") {
        Reading r = decode_ok("31234;000\r\n");
        REQUIRE(r.value == 1234.0);
    }

    SECTION("e0 = 5, bit 2 set") {
        Reading r = decode_ok("51234;000\r\n");
        REQUIRE(r.value == 1234.0);
    }

    SECTION("e0 = 0") {
        Reading r = decode_ok("01234;000\r\n");
        REQUIRE(r.value == 1.234);
    }
}

TEST_CASE("Diode mode shares the voltage range shift", "[decoder]") {
    Reading r = decode_ok("412341000\r\n");
    REQUIRE(r.kind == MeasurementKind::Diode);
    REQUIRE(r.unit == "V");
    REQUIRE(r.value == 123.4);
}

TEST_CASE("Capacitance is picofarad scaled", "[decoder]") {
    Reading r = decode_ok("050006000\r\n");
    REQUIRE(r.kind == MeasurementKind::Capacitance);
    REQUIRE(r.unit == "F");
    REQUIRE(r.value == 5e-9);
}

TEST_CASE("Capacitance ignores the voltage shift", "[decoder]") {
    // bit 2 of e0 set, but unit is not "V"
    Reading r = decode_ok("450006000\r\n");
    REQUIRE(r.value == 5e-5);
}

TEST_CASE("Temperature units", "[decoder]") {
    SECTION("Celsius when not-fahrenheit is set") {
        Reading r = decode_ok("00235480>\r\n");
        REQUIRE(r.kind == MeasurementKind::Temperature);
        REQUIRE(r.unit == UNIT_CELSIUS);
        REQUIRE(r.flags.not_fahrenheit);
        REQUIRE(r.value == 235.0);
    }

    SECTION("Fahrenheit otherwise") {
        Reading r = decode_ok("00235400>\r\n");
        REQUIRE(r.unit == UNIT_FAHRENHEIT);
        REQUIRE_FALSE(r.flags.not_fahrenheit);
        REQUIRE(r.value == 235.0);
    }
}

TEST_CASE("Current ranges", "[decoder]") {
    SECTION("code 9 is A") {
        Reading r = decode_ok("212349000\r\n");
        REQUIRE(r.kind == MeasurementKind::Current);
        REQUIRE(r.kind_code == 9);
        REQUIRE(r.unit == "A");
        REQUIRE(r.value == 1234.0);
    }

    SECTION("code 13 is uA") {
        Reading r = decode_ok("21234=000\r\n");
        REQUIRE(r.kind == MeasurementKind::Current);
        REQUIRE(r.kind_code == 13);
        REQUIRE(r.unit == "uA");
        REQUIRE(r.value == 12340.0);
    }

    SECTION("code 15 is mA") {
        Reading r = decode_ok("30042?80:\r\n");
        REQUIRE(r.kind == MeasurementKind::Current);
        REQUIRE(r.kind_code == 15);
        REQUIRE(r.unit == "mA");
        REQUIRE(r.value == 420.0);
        REQUIRE(r.flags.not_fahrenheit);
    }
}

TEST_CASE("Resistance, frequency and hFE", "[decoder]") {
    Reading ohm = decode_ok("310003082\r\n");
    REQUIRE(ohm.kind == MeasurementKind::Resistance);
    REQUIRE(ohm.unit == "Ohm");
    REQUIRE(ohm.value == 100000.0);
    REQUIRE(ohm.flags.hold);
    REQUIRE(ohm.flags.autorange);

    Reading cont = decode_ok("000555000\r\n");
    REQUIRE(cont.kind == MeasurementKind::Continuity);
    REQUIRE(cont.unit == "Ohm");
    REQUIRE(cont.value == 5.5);

    Reading hz = decode_ok("250002000\r\n");
    REQUIRE(hz.kind == MeasurementKind::Frequency);
    REQUIRE(hz.unit == "Hz");
    REQUIRE(hz.value == 500000.0);

    Reading hfe = decode_ok("00123>000\r\n");
    REQUIRE(hfe.kind == MeasurementKind::HFE);
    REQUIRE(hfe.unit.empty());
    REQUIRE(hfe.value == 123.0);
}

// ============================================================================
// Sign and overload
// ============================================================================

TEST_CASE("Sign flag negates", "[decoder]") {
    Reading r = decode_ok("41234;40:\r\n");
    REQUIRE(r.flags.sign);
    REQUIRE(r.value == -123.4);
}

TEST_CASE("Overload flag", "[decoder]") {
    Reading r = decode_ok("30000;100\r\n");
    REQUIRE(r.flags.overload);
    REQUIRE(r.value == 0.0);
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Bad length", "[decoder][error]") {
    Reading r;
    REQUIRE(decode_frame("", r) == Error::BadLength);
    REQUIRE(decode_frame("41234;03:\r", r) == Error::BadLength);
    REQUIRE(decode_frame("41234;03:\r\n\n", r) == Error::BadLength);
    REQUIRE(decode_frame("41234;03:", r) == Error::BadLength);
}

TEST_CASE("Invalid digit reports its position", "[decoder][error]") {
    struct Case {
        const char* frame;
        std::size_t position;
    };
    const Case cases[] = {
        {"A1234;000\r\n", 0}, {"4x234;000\r\n", 1}, {"412:4;000\r\n", 3},
        {"41234@000\r\n", 5}, {"41234;/00\r\n", 6}, {"41234;0 0\r\n", 7},
        {"41234;00@\r\n", 8},
    };

    for (const auto& c : cases) {
        Reading r;
        DecodeFailure failure;
        REQUIRE(decode_frame(c.frame, r, &failure) == Error::InvalidDigit);
        REQUIRE(failure.position == c.position);
    }
}

TEST_CASE("Unknown measurement kind", "[decoder][error]") {
    Reading r;
    r.value = 42.0;
    DecodeFailure failure;

    REQUIRE(decode_frame("012347000\r\n", r, &failure) == Error::UnknownMeasurementKind);
    REQUIRE(failure.kind_code == 7);
    REQUIRE(failure.position == 5);
    REQUIRE(r.value == 42.0); // no reading produced

    const char unassigned[] = {'0', '8', ':', '<'};
    for (char c : unassigned) {
        std::string frame = "01234X000\r\n";
        frame[5] = c;
        REQUIRE(decode_frame(frame, r, &failure) == Error::UnknownMeasurementKind);
        REQUIRE(failure.kind_code == static_cast<std::uint8_t>(c - '0'));
    }
}

TEST_CASE("Invalid digit wins over unknown kind", "[decoder][error]") {
    Reading r;
    DecodeFailure failure;
    REQUIRE(decode_frame("012347@00\r\n", r, &failure) == Error::InvalidDigit);
    REQUIRE(failure.position == 6);
}

TEST_CASE("Failure detail is optional", "[decoder][error]") {
    Reading r;
    REQUIRE(decode_frame("A1234;000\r\n", r, nullptr) == Error::InvalidDigit);
    REQUIRE(decode_frame("012347000\r\n", r) == Error::UnknownMeasurementKind);
}

TEST_CASE("Terminator characters are not inspected", "[decoder]") {
    Reading a = decode_ok("41234;03:\r\n");
    Reading b = decode_ok("41234;03:XY");
    REQUIRE(a.value == b.value);
    REQUIRE(a.unit == b.unit);
    REQUIRE(a.flags == b.flags);
}

TEST_CASE("Decoding is deterministic", "[decoder]") {
    Reading a = decode_ok("30042?80:\r\n");
    Reading b = decode_ok("30042?80:\r\n");
    REQUIRE(a.value == b.value);
    REQUIRE(a.unit == b.unit);
    REQUIRE(a.kind == b.kind);
    REQUIRE(a.kind_code == b.kind_code);
    REQUIRE(a.flags == b.flags);
}

// ============================================================================
// Throwing overload
// ============================================================================

TEST_CASE("Throwing decode returns the reading", "[decoder][exception]") {
    Reading r = decode_frame(std::string("41234;03:\r\n"));
    REQUIRE(r.value == 123.4);
    REQUIRE(r.unit == "V");
}

TEST_CASE("Throwing decode carries failure detail", "[decoder][exception]") {
    SECTION("invalid digit") {
        REQUIRE_THROWS_AS(decode_frame(std::string("412:4;000\r\n")), DecodeException);
        try {
            decode_frame(std::string("412:4;000\r\n"));
        } catch (const DecodeException& e) {
            REQUIRE(e.code() == Error::InvalidDigit);
            REQUIRE(e.position() == 3);
            REQUIRE(std::string(e.what()) == "Invalid digit at position 3");
        }
    }

    SECTION("unknown kind") {
        try {
            decode_frame(std::string("012347000\r\n"));
            FAIL("expected DecodeException");
        } catch (const DecodeException& e) {
            REQUIRE(e.code() == Error::UnknownMeasurementKind);
            REQUIRE(e.kind_code() == 7);
        }
    }

    SECTION("bad length is a Ut803Exception") {
        REQUIRE_THROWS_AS(decode_frame(std::string("short")), Ut803Exception);
    }
}
