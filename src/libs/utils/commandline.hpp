// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

#include <QString>
#include <QStringList>

namespace LspMux::Utils {

class LSPMUX_UTILS_EXPORT CommandLine {
public:
  CommandLine() = default;
  explicit CommandLine(const QString &executable, const QStringList &arguments = {});

  //! Split a single shell-like string ("pyright-langserver --stdio") into executable and arguments.
  static auto fromUserInput(const QString &cmdline) -> CommandLine;
  //! Quote a single argument for usage in a unix shell command
  static auto quoteArgUnix(const QString &arg) -> QString;

  auto executable() const -> QString { return m_executable; }
  auto setExecutable(const QString &executable) -> void { m_executable = executable; }
  auto arguments() const -> QStringList { return m_arguments; }
  auto setArguments(const QStringList &arguments) -> void { m_arguments = arguments; }
  auto addArg(const QString &arg) -> void;
  auto addArgs(const QStringList &inArgs) -> void;
  auto isEmpty() const -> bool { return m_executable.isEmpty(); }
  auto toUserOutput() const -> QString;

  friend auto operator==(const CommandLine &first, const CommandLine &second) -> bool
  {
    return first.m_executable == second.m_executable && first.m_arguments == second.m_arguments;
  }

  friend auto operator!=(const CommandLine &first, const CommandLine &second) -> bool
  {
    return !(first == second);
  }

private:
  QString m_executable;
  QStringList m_arguments;
};

} // namespace LspMux::Utils
