// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <qglobal.h>

#if defined(LSPMUX_UTILS_LIBRARY)
#  define LSPMUX_UTILS_EXPORT Q_DECL_EXPORT
#elif defined(LSPMUX_UTILS_STATIC_LIB)
#  define LSPMUX_UTILS_EXPORT
#else
#  define LSPMUX_UTILS_EXPORT Q_DECL_IMPORT
#endif
