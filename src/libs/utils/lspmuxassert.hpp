// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

namespace LspMux::Utils {
LSPMUX_UTILS_EXPORT auto writeAssertLocation(const char *msg) -> void;
LSPMUX_UTILS_EXPORT auto dumpBacktrace(int maxdepth) -> void;
} // namespace LspMux::Utils

#define LSPMUX_ASSERT_STRINGIFY_HELPER(x) #x
#define LSPMUX_ASSERT_STRINGIFY(x) LSPMUX_ASSERT_STRINGIFY_HELPER(x)
#define LSPMUX_ASSERT_STRING(cond) ::LspMux::Utils::writeAssertLocation(\
    "\"" cond"\" in file " __FILE__ ", line " LSPMUX_ASSERT_STRINGIFY(__LINE__))

// The 'do {...} while (0)' idiom is not used for the main block here to be
// able to use 'break' and 'continue' as 'actions'.

#define LSPMUX_ASSERT(cond, action) if (Q_LIKELY(cond)) {} else { LSPMUX_ASSERT_STRING(#cond); action; } do {} while (0)
#define LSPMUX_CHECK(cond) if (Q_LIKELY(cond)) {} else { LSPMUX_ASSERT_STRING(#cond); } do {} while (0)
#define LSPMUX_GUARD(cond) ((Q_LIKELY(cond)) ? true : (LSPMUX_ASSERT_STRING(#cond), false))
