/**
 * @file nibble.cpp
 * @brief Nibble decoding compilation unit.
 *
 * The digit decoders are small inline functions called once per frame
 * position, so they live entirely in nibble.hpp. This file includes the
 * header to verify it compiles in isolation.
 *
 * @see include/ut803/nibble.hpp for the full implementation
 */

#include <ut803/nibble.hpp>

// All implementation is in the header (inline functions)
