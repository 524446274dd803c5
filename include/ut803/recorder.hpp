/**
 * @file recorder.hpp
 * @brief Tab-separated recording of readings.
 *
 * Output is grouped in runs of one measurement kind. Each run opens with a
 * two-line header:
 *
 *     # initial flags: autorange, dc
 *     #time(s)	voltage(V)	overload
 *
 * followed by one line per accepted sample:
 *
 *     0.0	123.4	0
 *
 * Runs are separated by an empty line. The meter sends every sample twice,
 * so samples arriving within the debounce window of the last accepted one
 * are dropped.
 */

#ifndef UT803_RECORDER_HPP
#define UT803_RECORDER_HPP

#include "config.hpp"
#include "error.hpp"
#include "frame_decoder.hpp"

#include <ostream>

namespace ut803 {

/**
 * @brief Recording state carried between samples.
 */
struct SessionState {
    bool has_kind = false;                           ///< A run is open
    MeasurementKind kind = MeasurementKind::Unknown; ///< Kind of the open run
    double initial_time = 0.0;                       ///< Clock time the run started
    double last_time = RUN_START_LAST_TIME;          ///< Elapsed time of the last written sample
};

/**
 * @brief Outcome of recording one reading.
 */
enum class RecordResult {
    Written,   ///< Data line written
    Duplicate, ///< Dropped by the debounce window
};

/**
 * @brief Write the run header for a reading.
 */
void write_header(std::ostream& out, const Reading& reading);

/**
 * @brief Record one reading.
 *
 * Starts a new run when the measurement kind changes, then writes the data
 * line unless the sample falls within the debounce window. The stream is
 * flushed after every data line.
 *
 * @param state Session state, updated in place
 * @param reading Decoded reading
 * @param now Clock time in seconds
 * @param out Output stream
 * @param debounce Duplicate window in seconds
 * @param[out] result Written or Duplicate
 * @return Error::Ok, or Error::Io if the stream failed
 */
Error record(SessionState& state, const Reading& reading, double now, std::ostream& out,
             double debounce, RecordResult& result);

} // namespace ut803

#endif // UT803_RECORDER_HPP
