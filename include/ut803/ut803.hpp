/**
 * @file ut803.hpp
 * @brief UNI-T UT803 readout library.
 *
 * Decodes the 11-character frames the UT803 bench multimeter sends over
 * its optical RS-232 link and records them as tab-separated text.
 */

#ifndef UT803_HPP
#define UT803_HPP

#include "config.hpp"
#include "error.hpp"
#include "flags.hpp"
#include "format.hpp"
#include "frame_decoder.hpp"
#include "line_reader.hpp"
#include "measurement.hpp"
#include "nibble.hpp"
#include "recorder.hpp"
#include "serial_port.hpp"
#include "unit.hpp"

namespace ut803 {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace ut803

#endif // UT803_HPP
