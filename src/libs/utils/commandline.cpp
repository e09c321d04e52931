// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "commandline.hpp"

#include <QProcess>
#include <QRegularExpression>

namespace LspMux::Utils {

CommandLine::CommandLine(const QString &executable, const QStringList &arguments) : m_executable(executable), m_arguments(arguments) {}

auto CommandLine::fromUserInput(const QString &cmdline) -> CommandLine
{
  auto parts = QProcess::splitCommand(cmdline.trimmed());
  if (parts.isEmpty())
    return {};
  const auto executable = parts.takeFirst();
  return CommandLine(executable, parts);
}

auto CommandLine::quoteArgUnix(const QString &arg) -> QString
{
  if (arg.isEmpty())
    return QString("''");

  static const QRegularExpression special(R"([^A-Za-z0-9_\-+=,.:/@%])");
  if (!arg.contains(special))
    return arg;

  auto ret = arg;
  ret.replace('\'', "'\\''");
  ret.prepend('\'');
  ret.append('\'');
  return ret;
}

auto CommandLine::addArg(const QString &arg) -> void
{
  m_arguments.append(arg);
}

auto CommandLine::addArgs(const QStringList &inArgs) -> void
{
  m_arguments.append(inArgs);
}

auto CommandLine::toUserOutput() const -> QString
{
  auto result = quoteArgUnix(m_executable);
  for (const auto &arg : m_arguments)
    result += ' ' + quoteArgUnix(arg);
  return result;
}

} // namespace LspMux::Utils
