/**
 * @file cli.cpp
 * @brief UT803 command line recorder.
 *
 * Reads frames from the meter, writes tab-separated samples to a file or
 * stdout and optionally shows a live status line.
 */

#include <ut803/ut803.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>

#include <signal.h>
#include <time.h>

using namespace ut803;

namespace {

volatile sig_atomic_t g_stop = 0;

/// Upper bound for --delay, --timeout and --debounce.
constexpr double MAX_OPTION_SECONDS = 1e6;

void handle_signal(int) {
    g_stop = 1;
}

struct Options {
    const char* port = nullptr;
    const char* output = nullptr;
    double delay_s = 0.0;
    double timeout_s = DEFAULT_TIMEOUT_MS / 1000.0;
    double debounce_s = DEFAULT_DEBOUNCE_S;
    bool monitor = false;
    bool verbose = false;
};

} // namespace

static void print_version() {
    std::printf("ut803 %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("UNI-T UT803 multimeter recorder (v%s)\n", version());
    std::printf("=====================================\n\n");
    std::printf("Record and monitor data from a UT803 connected through its RS-232\n");
    std::printf("port or a USB serial adapter.\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <port> <output> [options]\n\n", prog_name);
    std::printf("Arguments:\n");
    std::printf("  port                Serial port of the meter (e.g. /dev/ttyUSB0)\n");
    std::printf("  output              Output file, - for stdout\n\n");
    std::printf("Options:\n");
    std::printf("  -d, --delay <s>     Wait after each recorded sample\n");
    std::printf("  -m, --monitor       Show a line with the current value and flags\n");
    std::printf("  -t, --timeout <s>   Serial read timeout (default %.1f)\n",
                DEFAULT_TIMEOUT_MS / 1000.0);
    std::printf("      --debounce <s>  Drop repeats closer than this (default %.2f)\n",
                DEFAULT_DEBOUNCE_S);
    std::printf("  -V, --verbose       Report dropped frames on stderr\n");
    std::printf("  -h, --help          Show this help message\n");
    std::printf("  -v, --version       Show version information\n\n");
    std::printf("Output:\n");
    std::printf("  # initial flags: <flags>\n");
    std::printf("  #time(s)<TAB><kind>(<unit>)<TAB>overload\n");
    std::printf("  <seconds><TAB><value><TAB><0|1>\n\n");
    std::printf("Examples:\n");
    std::printf("  %s /dev/ttyUSB0 log.tsv -m        # record to file, show monitor\n", prog_name);
    std::printf("  %s /dev/ttyUSB0 - -d 1            # one sample per second to stdout\n\n",
                prog_name);
}

static bool parse_seconds(const char* text, double& value) {
    char* end = nullptr;
    double parsed = std::strtod(text, &end);
    // Also rejects NaN
    if (end == text || *end != '\0' || !(parsed >= 0.0 && parsed <= MAX_OPTION_SECONDS)) {
        return false;
    }
    value = parsed;
    return true;
}

// Returns -1 to continue, otherwise the exit status.
static int parse_args(int argc, char** argv, Options& opts) {
    int positional = 0;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(arg, "-m") == 0 || std::strcmp(arg, "--monitor") == 0) {
            opts.monitor = true;
            continue;
        }
        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        double* target = nullptr;
        if (std::strcmp(arg, "-d") == 0 || std::strcmp(arg, "--delay") == 0) {
            target = &opts.delay_s;
        } else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--timeout") == 0) {
            target = &opts.timeout_s;
        } else if (std::strcmp(arg, "--debounce") == 0) {
            target = &opts.debounce_s;
        }
        if (target != nullptr) {
            if (i + 1 >= argc || !parse_seconds(argv[i + 1], *target)) {
                std::fprintf(stderr, "Error: %s requires a number of seconds from 0 to %g\n",
                             arg, MAX_OPTION_SECONDS);
                return 1;
            }
            if (target == &opts.timeout_s && opts.timeout_s <= 0.0) {
                std::fprintf(stderr, "Error: %s must be greater than zero\n", arg);
                return 1;
            }
            ++i;
            continue;
        }

        // "-" alone is the stdout output argument
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "Error: Unknown option: %s\n", arg);
            std::fprintf(stderr, "Usage: %s <port> <output> [options]\n", argv[0]);
            return 1;
        }

        if (positional == 0) {
            opts.port = arg;
        } else if (positional == 1) {
            opts.output = arg;
        } else {
            std::fprintf(stderr, "Error: Unexpected argument: %s\n", arg);
            return 1;
        }
        ++positional;
    }

    if (positional != 2) {
        std::fprintf(stderr, "Error: Port and output are required\n");
        std::fprintf(stderr, "Usage: %s <port> <output> [options]\n", argv[0]);
        return 1;
    }
    return -1;
}

static double clock_seconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

static int to_milliseconds(double seconds) {
    double ms = std::ceil(seconds * 1000.0);
    return static_cast<int>(std::min(ms, static_cast<double>(INT_MAX)));
}

// Returns early when a stop signal arrives.
static void pause_for(double seconds) {
    timespec remaining{};
    remaining.tv_sec = static_cast<time_t>(seconds);
    remaining.tv_nsec = static_cast<long>((seconds - static_cast<double>(remaining.tv_sec)) * 1e9);
    while (::nanosleep(&remaining, &remaining) != 0) {
        if (errno != EINTR || g_stop != 0) {
            return;
        }
    }
}

static int run(const Options& opts, SerialPort& port, std::ostream& out, std::FILE* monitor) {
    SessionState state;
    int timeout_ms = to_milliseconds(opts.timeout_s);
    std::string line;

    while (g_stop == 0) {
        Error result = port.read_line(line, timeout_ms);
        if (result == Error::Interrupted || result == Error::Timeout) {
            continue;
        }
        if (result != Error::Ok) {
            const char* reason =
                port.last_errno() != 0 ? std::strerror(port.last_errno()) : "end of stream";
            std::fprintf(stderr, "Error: Reading %s failed: %s\n", port.device().c_str(),
                         reason);
            return 1;
        }

        if (line.size() != FRAME_LENGTH) {
            if (opts.verbose) {
                std::fprintf(stderr, "Warning: Dropped record of %zu bytes\n", line.size());
            }
            continue;
        }

        Reading reading;
        DecodeFailure failure;
        result = decode_frame(line, reading, &failure);
        if (result != Error::Ok) {
            if (opts.verbose) {
                std::fprintf(stderr, "Warning: Dropped frame: %s (position %zu)\n",
                             error_string(result), failure.position);
            }
            continue;
        }

        RecordResult recorded;
        if (record(state, reading, clock_seconds(), out, opts.debounce_s, recorded) !=
            Error::Ok) {
            std::fprintf(stderr, "Error: Cannot write output: %s\n", opts.output);
            return 1;
        }
        if (recorded == RecordResult::Duplicate) {
            continue;
        }

        if (monitor != nullptr) {
            std::fputs(monitor_line(reading).c_str(), monitor);
            std::fflush(monitor);
        }

        if (opts.delay_s > 0.0) {
            pause_for(opts.delay_s);
        }
    }

    if (monitor != nullptr) {
        std::fputc('\n', monitor);
    }
    return 0;
}

int main(int argc, char** argv) {
    Options opts;
    int status = parse_args(argc, argv, opts);
    if (status >= 0) {
        return status;
    }

    bool to_stdout = std::strcmp(opts.output, "-") == 0;

    // Handlers without SA_RESTART so a blocked poll() returns EINTR
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    SerialPort port;
    if (port.open(opts.port) != Error::Ok) {
        std::fprintf(stderr, "Error: %s %s: %s\n", port.failed_step(), opts.port,
                     std::strerror(port.last_errno()));
        return 1;
    }

    std::ofstream file;
    if (!to_stdout) {
        file.open(opts.output, std::ios::out | std::ios::trunc);
        if (!file) {
            std::fprintf(stderr, "Error: Cannot open output file: %s\n", opts.output);
            return 1;
        }
    }
    std::ostream& out = to_stdout ? std::cout : file;

    if (opts.verbose) {
        std::fprintf(stderr, "Port:        %s (%d baud, %d%c%d)\n", opts.port, BAUD_RATE,
                     DATA_BITS, 'O', STOP_BITS);
        std::fprintf(stderr, "Output:      %s\n", to_stdout ? "stdout" : opts.output);
    }

    std::FILE* monitor = nullptr;
    if (opts.monitor) {
        monitor = to_stdout ? stderr : stdout;
    }

    return run(opts, port, out, monitor);
}
