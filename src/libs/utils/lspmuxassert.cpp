// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "lspmuxassert.hpp"

#include <QByteArray>
#include <QDebug>
#include <QMutex>
#include <QSet>

#if defined(Q_OS_UNIX)
#include <execinfo.h>
#include <cstdlib>
#endif

namespace LspMux::Utils {

auto dumpBacktrace(int maxdepth) -> void
{
  if (maxdepth <= 0)
    return;
#if defined(Q_OS_UNIX)
  constexpr auto ArraySize = 1000;
  void *bt[ArraySize] = {nullptr};
  const auto size = backtrace(bt, qMin(ArraySize, maxdepth + 1));
  const auto lines = backtrace_symbols(bt, size);
  if (!lines)
    return;
  for (auto i = 1; i < size; ++i)
    qDebug() << "> " << lines[i];
  free(lines);
#endif
}

auto writeAssertLocation(const char *msg) -> void
{
  static QMutex mutex;
  static QSet<QByteArray> seen;
  {
    // Report each location once; some assertions sit on paths taken per message.
    const QMutexLocker locker(&mutex);
    if (seen.contains(msg))
      return;
    seen.insert(msg);
  }

  static const auto goBoom = qEnvironmentVariableIsSet("LSPMUX_FATAL_ASSERTS");
  if (goBoom)
    qFatal("SOFT ASSERT made fatal: %s", msg);
  else
    qDebug("SOFT ASSERT: %s", msg);

  static const auto maxdepth = qEnvironmentVariableIntValue("LSPMUX_BACKTRACE_MAXDEPTH");
  dumpBacktrace(maxdepth);
}

} // namespace LspMux::Utils
