// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QtGlobal>

#if defined(LSPMUX_PROTOCOL_LIBRARY)
#  define LSPMUX_PROTOCOL_EXPORT Q_DECL_EXPORT
#elif defined(LSPMUX_PROTOCOL_STATIC_LIB)
#  define LSPMUX_PROTOCOL_EXPORT
#else
#  define LSPMUX_PROTOCOL_EXPORT Q_DECL_IMPORT
#endif
