/**
 * @file config.hpp
 * @brief UT803 compile-time configuration.
 *
 * Frame layout, serial line parameters and recorder defaults for the
 * UNI-T UT803 bench multimeter.
 */

#ifndef UT803_CONFIG_HPP
#define UT803_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace ut803 {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup frame Frame Layout
 *
 * One frame is 9 payload characters followed by "\r\n".
 * @{
 */
inline constexpr std::size_t FRAME_LENGTH = 11U;
inline constexpr std::size_t EXPONENT_POS = 0U;
inline constexpr std::size_t DIGITS_POS = 1U;
inline constexpr std::size_t DIGITS_COUNT = 4U;
inline constexpr std::size_t KIND_POS = 5U;
inline constexpr std::size_t FLAGS_POS = 6U;
inline constexpr std::size_t FLAGS_COUNT = 3U;
/** @} */

/**
 * @defgroup serial Serial Line
 * @{
 */
inline constexpr int BAUD_RATE = 19200;
inline constexpr int DATA_BITS = 7;
inline constexpr int STOP_BITS = 1;

/// Read timeout for one record in milliseconds
#ifndef UT803_DEFAULT_TIMEOUT_MS
#define UT803_DEFAULT_TIMEOUT_MS 2000
#endif

inline constexpr int DEFAULT_TIMEOUT_MS = UT803_DEFAULT_TIMEOUT_MS;

/// Upper bound for one buffered record before it is handed out unterminated
inline constexpr std::size_t MAX_LINE_LENGTH = 256U;
/** @} */

/**
 * @defgroup recorder Recorder Defaults
 * @{
 */

/// The meter sends every sample twice; repeats closer than this are dropped.
inline constexpr double DEFAULT_DEBOUNCE_S = 0.05;

/// Value of last_time after a run change so the first sample always passes.
inline constexpr double RUN_START_LAST_TIME = -10.0;
/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define UT803_NO_EXCEPTIONS=1 to build the library without the exception
 * classes and throwing overloads. Every operation keeps its Error-returning
 * form (decode_frame, SerialPort::open).
 * @{
 */
#ifndef UT803_NO_EXCEPTIONS
#define UT803_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace ut803

#endif // UT803_CONFIG_HPP
