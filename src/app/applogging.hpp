// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QtCore/qloggingcategory.h>
#include <QtCore/qstring.h>

namespace LspMux {
namespace Internal {

Q_DECLARE_LOGGING_CATEGORY(appLog)

template <typename T>
auto logDebug(const T &msg) -> void
{
  qCDebug(appLog).noquote() << msg;
}

template <typename T>
auto logWarn(const T &msg) -> void
{
  qCWarning(appLog).noquote() << msg;
}

template <typename T>
auto logError(const T &msg) -> void
{
  qCCritical(appLog).noquote() << msg;
}

} // namespace Internal
} // namespace LspMux
