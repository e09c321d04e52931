// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

#include "commandline.hpp"

#include <QProcess>

namespace LspMux::Utils {

// A QProcess owning its command line. Every call, including the blocking waits, has to happen in
// the thread the Process lives in.
class LSPMUX_UTILS_EXPORT Process : public QObject {
  Q_OBJECT

public:
  enum Result {
    // Finished successfully, exit code 0.
    FinishedWithSuccess,
    // Finished unsuccessfully, exit code different from 0.
    FinishedWithError,
    // Process terminated abnormally (kill)
    TerminatedAbnormally,
    // Executable could not be started
    StartFailed,
    // Still running or never started
    NotFinished
  };

  explicit Process(QObject *parent = nullptr);
  ~Process() override;
  Process(const Process &) = delete;
  Process(Process &&) = delete;

  auto operator=(const Process &) -> Process& = delete;
  auto operator=(Process &&) -> Process& = delete;

  auto setCommand(const CommandLine &cmdLine) -> void;
  auto commandLine() const -> const CommandLine&;
  auto setWorkingDirectory(const QString &dir) -> void;
  auto workingDirectory() const -> QString;
  auto start() -> void;
  auto waitForStarted(int msecs = 30000) -> bool;
  auto waitForFinished(int msecs) -> bool;
  auto terminate() -> void;
  auto kill() -> void;
  // Sends SIGTERM, waits graceMsecs, sends SIGKILL, waits graceMsecs.
  auto stopProcess(int graceMsecs = 300) -> bool;
  auto write(const QByteArray &data) -> qint64;
  auto closeWriteChannel() -> void;
  auto readAllStandardOutput() -> QByteArray;
  auto readAllStandardError() -> QByteArray;
  auto state() const -> QProcess::ProcessState;
  auto processId() const -> qint64;
  auto exitCode() const -> int;
  auto exitStatus() const -> QProcess::ExitStatus;
  auto error() const -> QProcess::ProcessError;
  auto errorString() const -> QString;
  auto result() const -> Result;
  auto exitMessage() const -> QString;

signals:
  auto started() -> void;
  auto finished() -> void;
  auto errorOccurred(QProcess::ProcessError error) -> void;
  auto readyReadStandardOutput() -> void;
  auto readyReadStandardError() -> void;

private:
  auto handleFinished(int exitCode, QProcess::ExitStatus status) -> void;
  auto handleError(QProcess::ProcessError error) -> void;

  QProcess m_process;
  CommandLine m_commandLine;
  Result m_result = NotFinished;
};

} // namespace LspMux::Utils
