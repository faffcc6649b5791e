// Copyright: 2026, Ableton AG, Berlin. All rights reserved.

#pragma once

/*!
 * \brief Wrapper file for the standalone Asio library
 *
 * Includes the Asio headers used by LanLight and silences the compiler
 * warnings that are specific to that library.
 */

// Clang
#if defined(__clang__)
#pragma clang diagnostic push
// warning: implicit conversion loses integer precision: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wconversion"
// warning: default label in switch which covers all enumeration values
#pragma clang diagnostic ignored "-Wcovered-switch-default"
// warning: use of old-style cast
#pragma clang diagnostic ignored "-Wold-style-cast"
// warning: implicit conversion changes signedness: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wsign-conversion"
// warning: 'symbol' is not defined, evaluates to 0
#pragma clang diagnostic ignored "-Wundef"
#endif

// GCC
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif

#if !defined(ASIO_STANDALONE)
#define ASIO_STANDALONE 1
#endif

#include <asio.hpp>
#include <asio/system_timer.hpp>

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

// Clang
#if defined(__clang__)
#pragma clang diagnostic pop
#endif
