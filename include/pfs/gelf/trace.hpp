////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#if GELF__TRACE_ENABLED
#   include <pfs/fmt.hpp>
#   include <cstdio>

#   define GELF__TRACE(t, f, ...) {                                            \
        fmt::print(stdout, "[T] {}: " f "\n", t , ##__VA_ARGS__); fflush(stdout);}
#else // GELF__TRACE_ENABLED
#   define GELF__TRACE(t, f, ...)
#endif // !GELF__TRACE_ENABLED
