// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "process.hpp"

#include "lspmuxassert.hpp"

#include <QLoggingCategory>

namespace LspMux::Utils {

static Q_LOGGING_CATEGORY(processLog, "lspmux.utils.process", QtWarningMsg);

Process::Process(QObject *parent) : QObject(parent)
{
  m_process.setProcessChannelMode(QProcess::SeparateChannels);
  connect(&m_process, &QProcess::started, this, &Process::started);
  connect(&m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, &Process::handleFinished);
  connect(&m_process, &QProcess::errorOccurred, this, &Process::handleError);
  connect(&m_process, &QProcess::readyReadStandardOutput, this, &Process::readyReadStandardOutput);
  connect(&m_process, &QProcess::readyReadStandardError, this, &Process::readyReadStandardError);
}

Process::~Process()
{
  // do not report the exit of a process that is torn down with us
  m_process.disconnect(this);
  stopProcess();
}

auto Process::setCommand(const CommandLine &cmdLine) -> void
{
  m_commandLine = cmdLine;
}

auto Process::commandLine() const -> const CommandLine&
{
  return m_commandLine;
}

auto Process::setWorkingDirectory(const QString &dir) -> void
{
  m_process.setWorkingDirectory(dir);
}

auto Process::workingDirectory() const -> QString
{
  return m_process.workingDirectory();
}

auto Process::start() -> void
{
  LSPMUX_ASSERT(m_process.state() == QProcess::NotRunning, return);
  LSPMUX_ASSERT(!m_commandLine.isEmpty(), m_result = StartFailed; return);
  m_result = NotFinished;
  qCDebug(processLog) << "starting" << m_commandLine.toUserOutput() << "in" << m_process.workingDirectory();
  m_process.start(m_commandLine.executable(), m_commandLine.arguments());
}

auto Process::waitForStarted(int msecs) -> bool
{
  return m_process.waitForStarted(msecs);
}

auto Process::waitForFinished(int msecs) -> bool
{
  return m_process.waitForFinished(msecs);
}

auto Process::terminate() -> void
{
  m_process.terminate();
}

auto Process::kill() -> void
{
  m_process.kill();
}

auto Process::stopProcess(int graceMsecs) -> bool
{
  if (state() == QProcess::NotRunning)
    return true;
  terminate();
  if (waitForFinished(graceMsecs))
    return true;
  qCDebug(processLog) << m_commandLine.executable() << "ignored terminate, killing it";
  kill();
  return waitForFinished(graceMsecs);
}

auto Process::write(const QByteArray &data) -> qint64
{
  return m_process.write(data);
}

auto Process::closeWriteChannel() -> void
{
  m_process.closeWriteChannel();
}

auto Process::readAllStandardOutput() -> QByteArray
{
  return m_process.readAllStandardOutput();
}

auto Process::readAllStandardError() -> QByteArray
{
  return m_process.readAllStandardError();
}

auto Process::state() const -> QProcess::ProcessState
{
  return m_process.state();
}

auto Process::processId() const -> qint64
{
  return m_process.processId();
}

auto Process::exitCode() const -> int
{
  return m_process.exitCode();
}

auto Process::exitStatus() const -> QProcess::ExitStatus
{
  return m_process.exitStatus();
}

auto Process::error() const -> QProcess::ProcessError
{
  return m_process.error();
}

auto Process::errorString() const -> QString
{
  return m_process.errorString();
}

auto Process::result() const -> Result
{
  return m_result;
}

auto Process::exitMessage() const -> QString
{
  const auto fullCmd = m_commandLine.toUserOutput();
  switch (m_result) {
  case FinishedWithSuccess:
    return tr("The command \"%1\" finished successfully.").arg(fullCmd);
  case FinishedWithError:
    return tr("The command \"%1\" terminated with exit code %2.").arg(fullCmd).arg(exitCode());
  case TerminatedAbnormally:
    return tr("The command \"%1\" terminated abnormally.").arg(fullCmd);
  case StartFailed:
    return tr("The command \"%1\" could not be started: %2").arg(fullCmd, errorString());
  case NotFinished:
    return tr("The command \"%1\" is still running.").arg(fullCmd);
  }
  return QString();
}

auto Process::handleFinished(int exitCode, QProcess::ExitStatus status) -> void
{
  if (status == QProcess::CrashExit)
    m_result = TerminatedAbnormally;
  else
    m_result = exitCode == 0 ? FinishedWithSuccess : FinishedWithError;
  qCDebug(processLog) << exitMessage();
  emit finished();
}

auto Process::handleError(QProcess::ProcessError error) -> void
{
  if (error == QProcess::FailedToStart)
    m_result = StartFailed;
  emit errorOccurred(error);
}

} // namespace LspMux::Utils
