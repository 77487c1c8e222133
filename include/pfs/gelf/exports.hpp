////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#ifndef GELF__STATIC
#   ifndef GELF__EXPORT
#       if _MSC_VER
#           if defined(GELF__EXPORTS)
#               define GELF__EXPORT __declspec(dllexport)
#           else
#               define GELF__EXPORT __declspec(dllimport)
#           endif
#       else
#           define GELF__EXPORT
#       endif
#   endif
#else
#   define GELF__EXPORT
#endif // !GELF__STATIC
