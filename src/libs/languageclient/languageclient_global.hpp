// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QtGlobal>

#if defined(LSPMUX_CLIENT_LIBRARY)
#  define LSPMUX_CLIENT_EXPORT Q_DECL_EXPORT
#elif defined(LSPMUX_CLIENT_STATIC_LIB)
#  define LSPMUX_CLIENT_EXPORT
#else
#  define LSPMUX_CLIENT_EXPORT Q_DECL_IMPORT
#endif

namespace LspMux::LanguageClient {
namespace Constants {

constexpr char CLIENT_NAME[] = "lspmux";
constexpr char CLIENT_VERSION[] = "1.0.0";
constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 30000;
constexpr int DEFAULT_START_TIMEOUT_MS = 60000;
constexpr int DEFAULT_SHUTDOWN_TIMEOUT_MS = 5000;
constexpr int DEFAULT_EXIT_GRACE_MS = 2000;
constexpr char INLINE_BACKEND_ID[] = "inline";

} // namespace Constants
} // namespace LspMux::LanguageClient
