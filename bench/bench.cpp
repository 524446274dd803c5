/**
 * @file bench.cpp
 * @brief Decode throughput benchmarks.
 *
 * Measures frame decoding and recording cost for regression testing during
 * development. At 19200 baud the meter delivers a few frames per second, so
 * this is about catching regressions, not about keeping up with the line.
 *
 * Usage:
 *   ./build/bench              # Run with default 100000 iterations
 *   ./build/bench 1000000      # Run with custom iteration count
 */

#include <ut803/ut803.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace ut803;

static constexpr int DEFAULT_ITERATIONS = 100000;

struct BenchFrame {
    const char* name;
    const char* frame;
};

static const BenchFrame FRAMES[] = {
    {"voltage", "41234;03:\r\n"},
    {"capacitance", "0500060;2\r\n"},
    {"temperature", "00235480>\r\n"},
    {"current-mA", "30042?80:\r\n"},
    {"resistance", "310003082\r\n"},
};

static void bench_decode(const char* name, const std::string& frame, int iterations) {
    Reading reading;

    // Warmup run
    Error result = decode_frame(frame, reading);
    if (result != Error::Ok) {
        std::printf("%-20s SKIP (%s)\n", name, error_string(result));
        return;
    }

    double sink = 0.0;
    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        if (decode_frame(frame, reading) == Error::Ok) {
            sink += reading.value;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    double per_frame_ns = total_ns / static_cast<double>(iterations);
    double frames_per_s = 1e9 / per_frame_ns;

    std::printf("%-20s %8.1f ns/frame  %12.0f frames/s  (checksum %g)\n",
                name, per_frame_ns, frames_per_s, sink);
}

static void bench_record(int iterations) {
    std::vector<Reading> readings;
    for (const auto& f : FRAMES) {
        Reading reading;
        if (decode_frame(f.frame, reading) == Error::Ok) {
            readings.push_back(reading);
        }
    }
    if (readings.empty()) {
        std::printf("%-20s SKIP (no frames)\n", "record");
        return;
    }

    std::ostringstream out;
    SessionState state;
    RecordResult recorded;

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        const Reading& reading = readings[static_cast<std::size_t>(i) % readings.size()];
        if (record(state, reading, static_cast<double>(i), out, DEFAULT_DEBOUNCE_S, recorded) !=
            Error::Ok) {
            std::printf("%-20s FAILED (stream error)\n", "record");
            return;
        }
        if ((i & 0xFFF) == 0) {
            out.str(std::string());
        }
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ns = std::chrono::duration<double, std::nano>(end - start).count();
    std::printf("%-20s %8.1f ns/sample\n", "record", total_ns / static_cast<double>(iterations));
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("UT803 Benchmarks\n");
    std::printf("================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Frame size: %zu bytes\n\n", FRAME_LENGTH);

    std::printf("Decode:\n");
    for (const auto& f : FRAMES) {
        bench_decode(f.name, f.frame, iterations);
    }

    std::printf("\nRecord (kind changes every sample):\n");
    bench_record(iterations);

    return 0;
}
