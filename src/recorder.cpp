/**
 * @file recorder.cpp
 * @brief Tab-separated recording of readings.
 */

#include <ut803/format.hpp>
#include <ut803/recorder.hpp>

#include <cstdio>

namespace ut803 {

void write_header(std::ostream& out, const Reading& reading) {
    out << "# initial flags: " << active_flag_names(reading.flags, ", ") << '\n'
        << "#time(s)\t" << kind_name(reading.kind) << '(' << reading.unit << ")\toverload\n";
}

Error record(SessionState& state, const Reading& reading, double now, std::ostream& out,
             double debounce, RecordResult& result) {
    double t = now - state.initial_time;

    if (!state.has_kind || reading.kind != state.kind) {
        if (state.has_kind) {
            out << '\n';
        }
        state.has_kind = true;
        state.kind = reading.kind;
        write_header(out, reading);

        state.initial_time = now;
        state.last_time = RUN_START_LAST_TIME;
        t = 0.0;
    }

    if (t - state.last_time < debounce) {
        result = RecordResult::Duplicate;
        return out ? Error::Ok : Error::Io;
    }
    state.last_time = t;

    char time_buf[32];
    std::snprintf(time_buf, sizeof(time_buf), "%.1f", t);
    out << time_buf << '\t' << format_value(reading.value) << '\t'
        << (reading.flags.overload ? '1' : '0') << '\n';
    out.flush();

    result = RecordResult::Written;
    return out ? Error::Ok : Error::Io;
}

} // namespace ut803
