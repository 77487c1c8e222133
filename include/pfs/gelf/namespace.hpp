////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `gelf-lib`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef GELF__NAMESPACE_NAME
#   define GELF__NAMESPACE_NAME gelf
#   define GELF__NAMESPACE_BEGIN namespace GELF__NAMESPACE_NAME {
#   define GELF__NAMESPACE_END }
#endif
