// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "languageclientinterface.hpp"

#include <utils/lspmuxassert.hpp>
#include <utils/process.hpp>

#include <QLoggingCategory>
#include <QMetaObject>

using namespace LspMux::LanguageServerProtocol;
using namespace LspMux::Utils;

static Q_LOGGING_CATEGORY(LOGLSPCLIENTV, "lspmux.languageclient.messages", QtWarningMsg);
static Q_LOGGING_CATEGORY(LOGLSPSTDERR, "lspmux.languageclient.stderr", QtWarningMsg);

namespace LspMux::LanguageClient {

BaseClientInterface::BaseClientInterface()
{
  m_buffer.open(QIODevice::ReadWrite | QIODevice::Append);
}

BaseClientInterface::~BaseClientInterface()
{
  m_buffer.close();
}

auto BaseClientInterface::sendMessage(const JsonRpcMessage &message) -> void
{
  sendData(message.toBaseMessage().toData());
}

auto BaseClientInterface::stop(int graceMsecs) -> bool
{
  Q_UNUSED(graceMsecs)
  return true;
}

auto BaseClientInterface::resetBuffer() -> void
{
  m_buffer.close();
  m_buffer.setData(nullptr);
  m_buffer.open(QIODevice::ReadWrite | QIODevice::Append);
  m_currentMessage = BaseMessage();
}

auto BaseClientInterface::parseData(const QByteArray &data) -> void
{
  const auto preWritePosition = m_buffer.pos();
  qCDebug(parseLog) << "parse buffer pos: " << preWritePosition;
  qCDebug(parseLog) << "  data: " << data;
  if (!m_buffer.atEnd())
    m_buffer.seek(preWritePosition + m_buffer.bytesAvailable());
  m_buffer.write(data);
  m_buffer.seek(preWritePosition);
  while (!m_buffer.atEnd()) {
    QString parseError;
    BaseMessage::parse(&m_buffer, parseError, m_currentMessage);
    qCDebug(parseLog) << "  complete: " << m_currentMessage.isComplete();
    qCDebug(parseLog) << "  length: " << m_currentMessage.contentLength;
    if (!parseError.isEmpty()) {
      // the stream cannot be resynchronized after a framing error
      resetBuffer();
      emit error(parseError);
      return;
    }
    if (!m_currentMessage.isComplete())
      break;
    emit messageReceived(m_currentMessage);
    m_currentMessage = BaseMessage();
  }
  if (m_buffer.atEnd()) {
    m_buffer.close();
    m_buffer.setData(nullptr);
    m_buffer.open(QIODevice::ReadWrite | QIODevice::Append);
  }
}

StdIOClientInterface::StdIOClientInterface()
{
  m_thread.setObjectName("lspmux-io");
  m_ioContext.moveToThread(&m_thread);
}

StdIOClientInterface::~StdIOClientInterface()
{
  stop(0);
}

auto StdIOClientInterface::start() -> bool
{
  LSPMUX_ASSERT(!m_thread.isRunning(), return false);
  m_stopRequested = false;
  m_thread.start();

  bool started = false;
  QMetaObject::invokeMethod(&m_ioContext, [this, &started] {
    m_process = new Process(&m_ioContext);
    m_process->setCommand(m_commandLine);
    if (!m_workingDirectory.isEmpty())
      m_process->setWorkingDirectory(m_workingDirectory);
    connect(m_process, &Process::readyReadStandardError, &m_ioContext, [this] { readError(); });
    connect(m_process, &Process::readyReadStandardOutput, &m_ioContext, [this] { readOutput(); });
    connect(m_process, &Process::finished, &m_ioContext, [this] { onProcessFinished(); });
    m_process->start();
    started = m_process->waitForStarted() && m_process->state() == QProcess::Running;
    if (started) {
      m_processId = m_process->processId();
      m_running = true;
    } else {
      QMutexLocker locker(&m_errorMutex);
      m_errorString = m_process->exitMessage();
    }
  }, Qt::BlockingQueuedConnection);

  if (!started) {
    qCWarning(LOGLSPCLIENTV) << "cannot start" << m_commandLine.toUserOutput() << ":" << errorString();
    shutdownThread();
  }
  return started;
}

auto StdIOClientInterface::stop(int graceMsecs) -> bool
{
  if (!m_thread.isRunning())
    return !m_running;
  LSPMUX_ASSERT(QThread::currentThread() != &m_thread, abort(); return false);

  m_stopRequested = true;
  bool gone = true;
  QMetaObject::invokeMethod(&m_ioContext, [this, graceMsecs, &gone] {
    if (!m_process)
      return;
    if (m_process->state() != QProcess::NotRunning && !m_process->waitForFinished(graceMsecs)) {
      qCDebug(LOGLSPCLIENTV) << m_commandLine.executable() << "did not exit within" << graceMsecs << "ms, terminating it";
      gone = m_process->stopProcess(graceMsecs);
    }
  }, Qt::BlockingQueuedConnection);
  shutdownThread();
  return gone;
}

auto StdIOClientInterface::abort() -> void
{
  QMetaObject::invokeMethod(&m_ioContext, [this] {
    if (m_process && m_process->state() != QProcess::NotRunning)
      m_process->kill();
  }, Qt::QueuedConnection);
}

auto StdIOClientInterface::shutdownThread() -> void
{
  QMetaObject::invokeMethod(&m_ioContext, [this] {
    delete m_process;
    m_process = nullptr;
  }, Qt::BlockingQueuedConnection);
  m_running = false;
  m_thread.quit();
  m_thread.wait();
}

auto StdIOClientInterface::errorString() const -> QString
{
  QMutexLocker locker(&m_errorMutex);
  return m_errorString;
}

auto StdIOClientInterface::setCommandLine(const CommandLine &cmd) -> void
{
  m_commandLine = cmd;
}

auto StdIOClientInterface::setWorkingDirectory(const QString &workingDirectory) -> void
{
  m_workingDirectory = workingDirectory;
}

auto StdIOClientInterface::sendData(const QByteArray &data) -> void
{
  QMutexLocker locker(&m_sendMutex);
  if (!m_running) {
    qCWarning(LOGLSPCLIENTV) << "cannot send data to unstarted server" << m_commandLine.toUserOutput();
    return;
  }
  qCDebug(LOGLSPCLIENTV) << "StdIOClient send data:";
  qCDebug(LOGLSPCLIENTV).noquote() << data;
  // posted events are delivered in order, so frames never interleave
  QMetaObject::invokeMethod(&m_ioContext, [this, data] {
    if (m_process && m_process->state() == QProcess::Running)
      m_process->write(data);
  }, Qt::QueuedConnection);
}

auto StdIOClientInterface::onProcessFinished() -> void
{
  m_running = false;
  {
    QMutexLocker locker(&m_errorMutex);
    m_errorString = m_process->exitMessage();
  }
  if (!m_stopRequested)
    qCWarning(LOGLSPCLIENTV).noquote() << errorString();
  // flush what the server wrote before it went away
  const auto out = m_process->readAllStandardOutput();
  if (!out.isEmpty())
    parseData(out);
  emit finished();
}

auto StdIOClientInterface::readError() -> void
{
  const auto err = m_process->readAllStandardError();
  for (const auto &line : err.split('\n')) {
    if (!line.trimmed().isEmpty())
      qCInfo(LOGLSPSTDERR).noquote() << m_commandLine.executable() << ":" << QString::fromUtf8(line);
  }
}

auto StdIOClientInterface::readOutput() -> void
{
  const auto &out = m_process->readAllStandardOutput();
  qCDebug(LOGLSPCLIENTV) << "StdIOClient std out:\n";
  qCDebug(LOGLSPCLIENTV).noquote() << out;
  parseData(out);
}

} // namespace LspMux::LanguageClient
