// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageclient_global.hpp"

#include <languageserverprotocol/basemessage.hpp>
#include <languageserverprotocol/jsonrpcmessages.hpp>

#include <utils/commandline.hpp>

#include <QBuffer>
#include <QMutex>
#include <QThread>

#include <atomic>

namespace LspMux::Utils {
class Process;
}

namespace LspMux::LanguageClient {

// A bidirectional message channel to a language server. Received messages, errors and the end of
// the connection are signalled from the thread of eventContext().
class LSPMUX_CLIENT_EXPORT BaseClientInterface : public QObject {
  Q_OBJECT

public:
  BaseClientInterface();
  ~BaseClientInterface() override;

  // Thread-safe.
  auto sendMessage(const LanguageServerProtocol::JsonRpcMessage &message) -> void;
  virtual auto start() -> bool { return true; }
  // Waits up to graceMsecs for the server to exit by itself before terminating it. Returns whether
  // the server is gone. Must not be called from the thread of eventContext().
  virtual auto stop(int graceMsecs) -> bool;
  // Kills the server without waiting, callable from any thread.
  virtual auto abort() -> void {}
  virtual auto isRunning() const -> bool { return true; }
  virtual auto errorString() const -> QString { return {}; }
  // The object whose thread parses incoming data and runs request timers.
  virtual auto eventContext() -> QObject* { return this; }
  auto resetBuffer() -> void;

signals:
  auto messageReceived(const LanguageServerProtocol::BaseMessage &message) -> void;
  auto finished() -> void;
  auto error(const QString &message) -> void;

protected:
  virtual auto sendData(const QByteArray &data) -> void = 0;
  auto parseData(const QByteArray &data) -> void;

private:
  QBuffer m_buffer;
  LanguageServerProtocol::BaseMessage m_currentMessage;
};

// Runs the server as a subprocess talking over stdin and stdout. The process lives in a dedicated
// I/O thread, so incoming data is processed while callers block on replies.
class LSPMUX_CLIENT_EXPORT StdIOClientInterface : public BaseClientInterface {
  Q_OBJECT

public:
  StdIOClientInterface();
  ~StdIOClientInterface() override;
  StdIOClientInterface(const StdIOClientInterface &) = delete;
  StdIOClientInterface(StdIOClientInterface &&) = delete;

  auto operator=(const StdIOClientInterface &) -> StdIOClientInterface& = delete;
  auto operator=(StdIOClientInterface &&) -> StdIOClientInterface& = delete;

  auto start() -> bool override;
  auto stop(int graceMsecs) -> bool override;
  auto abort() -> void override;
  auto isRunning() const -> bool override { return m_running; }
  auto errorString() const -> QString override;
  auto eventContext() -> QObject* override { return &m_ioContext; }
  auto processId() const -> qint64 { return m_processId; }

  // These functions only have an effect if they are called before start
  auto setCommandLine(const Utils::CommandLine &cmd) -> void;
  auto setWorkingDirectory(const QString &workingDirectory) -> void;
  auto commandLine() const -> Utils::CommandLine { return m_commandLine; }

protected:
  auto sendData(const QByteArray &data) -> void final;

private:
  auto readError() -> void;
  auto readOutput() -> void;
  auto onProcessFinished() -> void;
  auto shutdownThread() -> void;

  Utils::CommandLine m_commandLine;
  QString m_workingDirectory;
  QThread m_thread;
  QObject m_ioContext;
  Utils::Process *m_process = nullptr; // owned by m_ioContext, lives in m_thread
  QMutex m_sendMutex;
  mutable QMutex m_errorMutex;
  QString m_errorString;
  std::atomic_bool m_running{false};
  std::atomic_bool m_stopRequested{false};
  std::atomic<qint64> m_processId{0};
};

} // namespace LspMux::LanguageClient
