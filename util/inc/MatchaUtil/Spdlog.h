/**
   Include this file instead of directly including spdlog or fmt headers.
 */

#ifndef MATCHA_SPDLOG
#define MATCHA_SPDLOG

// Use SPDLOG_LOGGER_TRACE() for trace level logs so they compile out.  The
// compile time minimum level comes from the build:
//
//   cmake -DMATCHA_SPDLOG_ACTIVE_LEVEL=TRACE [...]

#include "MatchaUtil/BuildConfig.h"

#include <spdlog/spdlog.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

// Types printable with operator<< get a specialization like:
//
// template <> struct fmt::formatter<TYPE> : fmt::ostream_formatter {};
#if FMT_VERSION < 90000
#error "fmt 9 or newer is required for fmt::ostream_formatter"
#endif

#endif
