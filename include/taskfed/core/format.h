#pragma once

// Compatibility header for std::format
// Uses std::format when available, falls back to fmt library

#include <version>

#if !defined(TASKFED_HAS_STD_FORMAT)
#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
#define TASKFED_HAS_STD_FORMAT 1
#else
#define TASKFED_HAS_STD_FORMAT 0
#endif
#endif

#if TASKFED_HAS_STD_FORMAT
#include <format>
namespace taskfed {
using std::format;
using std::format_to;
} // namespace taskfed
#else
#include <spdlog/fmt/fmt.h>

namespace taskfed {
using fmt::format;
using fmt::format_to;
} // namespace taskfed
#endif
