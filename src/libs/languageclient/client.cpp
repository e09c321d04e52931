// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "client.hpp"

#include "languageclientinterface.hpp"

#include <languageserverprotocol/languagefeatures.hpp>
#include <languageserverprotocol/lsptypes.hpp>

#include <utils/lspmuxassert.hpp>

#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QThread>

using namespace LspMux::LanguageServerProtocol;

static Q_LOGGING_CATEGORY(LOGLSPCLIENT, "lspmux.languageclient.client", QtWarningMsg);

namespace LspMux::LanguageClient {

constexpr char textDocumentKey[] = "textDocument";
constexpr char capabilitiesKey[] = "capabilities";
constexpr char serverInfoKey[] = "serverInfo";
constexpr char nameKey[] = "name";
constexpr char versionKey[] = "version";
constexpr char uriKey[] = "uri";

Client::Client(const BackendSettings &settings, BaseClientInterface *clientInterface) : m_settings(settings), m_correlator(settings.m_id), m_clientInterface(clientInterface)
{
  LSPMUX_ASSERT(m_clientInterface, return);
  // the interface signals from its I/O thread, the handlers below are thread-safe
  connect(clientInterface, &BaseClientInterface::messageReceived, this, &Client::handleMessage, Qt::DirectConnection);
  connect(clientInterface, &BaseClientInterface::error, this, &Client::handleInterfaceError, Qt::DirectConnection);
  connect(clientInterface, &BaseClientInterface::finished, this, &Client::handleInterfaceFinished, Qt::DirectConnection);
}

Client::~Client()
{
  if (m_clientInterface)
    disconnect(m_clientInterface.data(), nullptr, this, nullptr);
  m_correlator.failAll(LspError(LspError::BackendTerminated, tr("The backend client was destroyed."), id()));
}

auto Client::stateString(State state) -> QString
{
  switch (state) {
  case NotStarted:
    return tr("not started");
  case Starting:
    return tr("starting");
  case Initializing:
    return tr("initializing");
  case Ready:
    return tr("ready");
  case Failed:
    return tr("failed");
  case ShuttingDown:
    return tr("shutting down");
  case Stopped:
    return tr("stopped");
  }
  return tr("unknown");
}

auto Client::state() const -> State
{
  QMutexLocker locker(&m_stateMutex);
  return m_state;
}

auto Client::failure() const -> std::optional<LspError>
{
  QMutexLocker locker(&m_stateMutex);
  return m_failure;
}

auto Client::setState(State state) -> bool
{
  {
    QMutexLocker locker(&m_stateMutex);
    if (m_state == state)
      return true;
    // Failed is terminal until an explicit stop, Stopped for good
    if (m_state == Stopped || (m_state == Failed && state != Stopped))
      return false;
    m_state = state;
  }
  qCDebug(LOGLSPCLIENT) << "language server" << id() << "is" << stateString(state);
  emit stateChanged(state);
  return true;
}

auto Client::setError(const LspError &error) -> void
{
  const auto failure = error.withContext(id(), QString());
  {
    QMutexLocker locker(&m_stateMutex);
    if (m_state == Failed || m_state == Stopped)
      return;
    m_state = Failed;
    m_failure = failure;
  }
  qCWarning(LOGLSPCLIENT).noquote() << failure.toString();
  emit stateChanged(Failed);
  m_correlator.failAll(failure);
  m_clientInterface->abort();
}

auto Client::ensureStarted() -> std::optional<LspError>
{
  QMutexLocker startLocker(&m_startMutex);
  switch (state()) {
  case Ready:
    return std::nullopt;
  case Failed:
    // the original failure is kept until an explicit restart
    return notReadyError(Methods::initialize);
  case ShuttingDown:
  case Stopped:
    return LspError(LspError::BackendNotReady, tr("The backend was stopped."), id(), Methods::initialize);
  case Starting:
  case Initializing:
    // only reachable if a previous start was interrupted, which the start lock prevents
    LSPMUX_CHECK(false);
    return notReadyError(Methods::initialize);
  case NotStarted:
    break;
  }

  qCDebug(LOGLSPCLIENT) << "starting language server" << id() << m_settings.command().toUserOutput();
  setState(Starting);
  if (!m_clientInterface->start()) {
    const LspError error(LspError::BackendStartError, m_clientInterface->errorString(), id(), Methods::initialize);
    setError(error);
    return error;
  }

  const auto pending = sendRequest(Methods::initialize, initializeParams(), m_startTimeout);
  const auto reply = waitForReply(pending.future);
  if (reply.isError() || !reply.result().isObject()) {
    const auto cause = reply.isError() ? reply.error()->toString() : tr("No initialize result.");
    const LspError error(LspError::BackendStartError, tr("Initialize error: %1").arg(cause), id(), Methods::initialize);
    setError(error);
    return error;
  }

  const auto result = reply.result().toObject();
  const auto serverInfo = result.value(serverInfoKey).toObject();
  {
    QMutexLocker locker(&m_stateMutex);
    m_serverCapabilities = ServerCapabilities(result.value(capabilitiesKey).toObject());
    m_serverName = serverInfo.value(nameKey).toString();
    m_serverVersion = serverInfo.value(versionKey).toString();
  }
  if (!setState(Initializing))
    return LspError(LspError::BackendStartError, tr("The backend failed during initialization."), id(), Methods::initialize);
  sendMessage(JsonRpcMessage::notification(Methods::initialized, QJsonObject()));
  if (!setState(Ready))
    return LspError(LspError::BackendStartError, tr("The backend failed during initialization."), id(), Methods::initialized);
  qCDebug(LOGLSPCLIENT) << "language server" << id() << "initialized:" << m_serverName << m_serverVersion;
  return std::nullopt;
}

auto Client::stop() -> std::optional<LspError>
{
  QMutexLocker startLocker(&m_startMutex);
  const auto previous = state();
  if (previous == Stopped)
    return std::nullopt;
  if (previous == NotStarted) {
    setState(Stopped);
    return std::nullopt;
  }

  qCDebug(LOGLSPCLIENT) << "shutdown language server" << id();
  std::optional<LspError> error;
  if (previous == Ready) {
    setState(ShuttingDown);
    const auto reply = waitForReply(sendRequest(Methods::shutdown, QJsonValue(QJsonValue::Undefined), m_shutdownTimeout).future);
    if (reply.isError())
      error = LspError(LspError::ShutdownError, tr("Shutdown request failed: %1").arg(reply.error()->toString()), id(), Methods::shutdown);
    sendMessage(JsonRpcMessage::notification(Methods::exit));
  }

  m_correlator.failAll(LspError(LspError::BackendTerminated, tr("The backend was stopped."), id()));
  if (!m_clientInterface->stop(m_exitGrace)) {
    error = LspError(LspError::ShutdownError, tr("The backend process did not exit."), id(), Methods::exit);
  }
  setState(Stopped);
  {
    QMutexLocker locker(&m_documentMutex);
    m_openDocuments.clear();
  }
  if (error)
    qCWarning(LOGLSPCLIENT).noquote() << error->toString();
  return error;
}

auto Client::defaultClientCapabilities() -> QJsonObject
{
  const QJsonObject linkSupport{{"linkSupport", true}};
  const QJsonArray markupKinds{"markdown", "plaintext"};
  const QJsonObject textDocument{
    {"synchronization", QJsonObject{{"dynamicRegistration", false}, {"willSave", false}, {"didSave", false}}},
    {"hover", QJsonObject{{"contentFormat", markupKinds}}},
    {"definition", linkSupport},
    {"declaration", linkSupport},
    {"typeDefinition", linkSupport},
    {"implementation", linkSupport},
    {"references", QJsonObject()},
    {"documentSymbol", QJsonObject{{"hierarchicalDocumentSymbolSupport", true}}},
    {"completion", QJsonObject{{"completionItem", QJsonObject{{"snippetSupport", false}, {"documentationFormat", markupKinds}}}}},
    {"rename", QJsonObject{{"prepareSupport", false}}},
    {"publishDiagnostics", QJsonObject{{"relatedInformation", false}}},
  };
  const QJsonObject workspace{
    {"symbol", QJsonObject()},
    {"workspaceFolders", true},
    {"configuration", true},
    {"applyEdit", false},
  };
  return QJsonObject{
    {textDocumentKey, textDocument},
    {"workspace", workspace},
    {"window", QJsonObject{{"workDoneProgress", true}}},
  };
}

auto Client::initializeParams() const -> QJsonObject
{
  const auto workspace = m_settings.m_workspace.isEmpty() ? QDir::currentPath() : m_settings.m_workspace;
  const auto rootUri = DocumentUri::fromFilePath(workspace);
  QJsonObject params{
    {"processId", QCoreApplication::applicationPid()},
    {"clientInfo", QJsonObject{{nameKey, Constants::CLIENT_NAME}, {versionKey, Constants::CLIENT_VERSION}}},
    {"rootUri", rootUri},
    {"rootPath", workspace},
    {"workspaceFolders", QJsonArray{QJsonObject{{uriKey, rootUri}, {nameKey, QFileInfo(workspace).fileName()}}}},
    {capabilitiesKey, defaultClientCapabilities()},
    {"trace", "off"},
  };
  if (!m_settings.m_initializationOptions.isEmpty())
    params.insert("initializationOptions", m_settings.m_initializationOptions);
  return params;
}

auto Client::capabilities() const -> ServerCapabilities
{
  QMutexLocker locker(&m_stateMutex);
  return m_serverCapabilities;
}

auto Client::dynamicCapabilities() const -> DynamicCapabilities
{
  QMutexLocker locker(&m_stateMutex);
  return m_dynamicCapabilities;
}

auto Client::hasCapability(const QString &path) const -> bool
{
  QMutexLocker locker(&m_stateMutex);
  return m_serverCapabilities.has(path) || m_dynamicCapabilities.isCapabilityRegistered(path);
}

auto Client::supportsMethod(const QString &method) const -> bool
{
  const auto path = ServerCapabilities::capabilityForMethod(method);
  if (path.isEmpty())
    return true;
  if (hasCapability(path))
    return true;
  QMutexLocker locker(&m_stateMutex);
  return m_dynamicCapabilities.isRegistered(method).value_or(false);
}

auto Client::serverName() const -> QString
{
  QMutexLocker locker(&m_stateMutex);
  return m_serverName;
}

auto Client::serverVersion() const -> QString
{
  QMutexLocker locker(&m_stateMutex);
  return m_serverVersion;
}

auto Client::documentKey(const QString &filePath) -> QString
{
  return QDir::cleanPath(QFileInfo(filePath).absoluteFilePath());
}

auto Client::ensureDocumentOpen(const QString &filePath, const QString &languageId) -> std::optional<LspError>
{
  if (state() != Ready)
    return notReadyError(Methods::didOpen);

  const auto key = documentKey(filePath);
  // held across reading, sending and recording, so a document is opened exactly once
  QMutexLocker locker(&m_documentMutex);
  if (m_openDocuments.contains(key))
    return std::nullopt;

  QFile file(key);
  if (!file.open(QIODevice::ReadOnly))
    return LspError(LspError::DocumentError, tr("Cannot read \"%1\": %2").arg(QDir::toNativeSeparators(key), file.errorString()), id(), Methods::didOpen);

  TextDocumentItem item;
  item.uri = DocumentUri::fromFilePath(key);
  item.languageId = languageId;
  item.version = 1;
  item.text = QString::fromUtf8(file.readAll());
  if (capabilities().sendsOpenClose())
    sendMessage(JsonRpcMessage::notification(Methods::didOpen, QJsonObject{{textDocumentKey, item.toJson()}}));
  else
    qCDebug(LOGLSPCLIENT) << id() << "declined open/close notifications, only recording" << key;
  m_openDocuments.insert(key, OpenDocument{item.uri, languageId, item.version});
  return std::nullopt;
}

auto Client::closeDocument(const QString &filePath) -> std::optional<LspError>
{
  if (state() != Ready)
    return notReadyError(Methods::didClose);

  QMutexLocker locker(&m_documentMutex);
  const auto it = m_openDocuments.find(documentKey(filePath));
  if (it == m_openDocuments.end())
    return std::nullopt;
  if (capabilities().sendsOpenClose())
    sendMessage(JsonRpcMessage::notification(Methods::didClose, QJsonObject{{textDocumentKey, textDocumentIdentifier(it->uri)}}));
  m_openDocuments.erase(it);
  return std::nullopt;
}

auto Client::isDocumentOpen(const QString &filePath) const -> bool
{
  QMutexLocker locker(&m_documentMutex);
  return m_openDocuments.contains(documentKey(filePath));
}

auto Client::documentVersion(const QString &filePath) const -> int
{
  QMutexLocker locker(&m_documentMutex);
  const auto it = m_openDocuments.constFind(documentKey(filePath));
  return it == m_openDocuments.constEnd() ? 0 : it->version;
}

auto Client::notReadyError(const QString &method) const -> LspError
{
  if (const auto cause = failure())
    return LspError(cause->kind, cause->message, id(), method);
  return LspError(LspError::BackendNotReady, tr("The backend is %1.").arg(stateString()), id(), method);
}

auto Client::request(const QString &method, const QJsonValue &params, int timeoutMsecs) -> Reply
{
  return waitForReply(requestAsync(method, params, timeoutMsecs).future);
}

auto Client::requestAsync(const QString &method, const QJsonValue &params, int timeoutMsecs) -> PendingReply
{
  if (state() != Ready)
    return {MessageId(), readyReply(Reply::fromError(notReadyError(method)))};
  return sendRequest(method, params, timeoutMsecs);
}

auto Client::sendRequest(const QString &method, const QJsonValue &params, int timeoutMsecs) -> PendingReply
{
  const auto requestId = m_correlator.nextId();
  const auto future = m_correlator.registerRequest(requestId, method);
  LSPMUX_ASSERT(future, return {MessageId(), readyReply(Reply::fromError(LspError(LspError::BackendProtocolError, tr("Cannot register request."), id(), method)))});
  // a failure between the state check and the registration would leave the request unresolved
  if (const auto cause = failure()) {
    m_correlator.resolve(requestId, Reply::fromError(*cause));
    return {requestId, *future};
  }
  sendMessage(JsonRpcMessage::request(requestId, method, params));
  m_correlator.timeoutAfter(requestId, timeoutMsecs < 0 ? m_requestTimeout : timeoutMsecs, m_clientInterface->eventContext());
  return {requestId, *future};
}

auto Client::waitForReply(const QFuture<Reply> &future) const -> Reply
{
  auto waited = future;
  if (!waited.isFinished()) {
    const auto context = m_clientInterface->eventContext();
    if (context && QThread::currentThread() == context->thread()) {
      // timers and incoming data are processed by this thread, so keep its event loop running
      QEventLoop loop;
      QFutureWatcher<Reply> watcher;
      connect(&watcher, &QFutureWatcher<Reply>::finished, &loop, &QEventLoop::quit);
      watcher.setFuture(waited);
      if (!waited.isFinished())
        loop.exec();
    } else {
      waited.waitForFinished();
    }
  }
  if (waited.resultCount() == 0)
    return Reply::fromError(LspError(LspError::BackendTerminated, tr("The request was abandoned."), id()));
  return waited.result();
}

auto Client::cancelRequest(const MessageId &id) -> bool
{
  return m_correlator.cancel(id);
}

auto Client::notify(const QString &method, const QJsonValue &params) -> std::optional<LspError>
{
  if (state() != Ready)
    return notReadyError(method);
  sendMessage(JsonRpcMessage::notification(method, params));
  return std::nullopt;
}

auto Client::sendMessage(const JsonRpcMessage &message) -> void
{
  m_clientInterface->sendMessage(message);
}

auto Client::handleMessage(const BaseMessage &message) -> void
{
  QString parseError;
  const auto jsonMessage = JsonRpcMessage::fromBaseMessage(message, &parseError);
  if (!parseError.isEmpty()) {
    setError(LspError(LspError::FramingError, parseError, id()));
    return;
  }
  switch (jsonMessage.kind()) {
  case JsonRpcMessage::Response:
    m_correlator.resolveResponse(jsonMessage);
    break;
  case JsonRpcMessage::Request:
    handleServerRequest(jsonMessage);
    break;
  case JsonRpcMessage::Notification:
    handleNotification(jsonMessage);
    break;
  case JsonRpcMessage::Invalid:
    break;
  }
}

auto Client::handleServerRequest(const JsonRpcMessage &message) -> void
{
  const auto method = message.method();
  const auto params = message.params().toObject();
  QJsonValue result;
  std::optional<ResponseError> error;

  if (method == Methods::registerCapability) {
    QMutexLocker locker(&m_stateMutex);
    m_dynamicCapabilities.registerCapability(params.value("registrations").toArray());
  } else if (method == Methods::unregisterCapability) {
    QMutexLocker locker(&m_stateMutex);
    // the protocol misspells the key
    m_dynamicCapabilities.unregisterCapability(params.value("unregisterations").toArray());
  } else if (method == Methods::workspaceConfiguration) {
    QJsonArray configurations;
    for (int i = 0, count = params.value("items").toArray().size(); i < count; ++i)
      configurations.append(QJsonValue());
    result = configurations;
  } else if (method == Methods::workspaceFolders) {
    const auto workspace = m_settings.m_workspace.isEmpty() ? QDir::currentPath() : m_settings.m_workspace;
    result = QJsonArray{QJsonObject{{uriKey, DocumentUri::fromFilePath(workspace)}, {nameKey, QFileInfo(workspace).fileName()}}};
  } else if (method == Methods::workDoneProgressCreate) {
    // nothing to track
  } else {
    error = ResponseError(ResponseError::MethodNotFound, tr("Unsupported method: %1").arg(method));
  }

  const auto current = state();
  if (current == Failed || current == Stopped) {
    qCDebug(LOGLSPCLIENT) << QString("Dropped response to request %1 id %2 for unreachable server %3").arg(method, message.id().toString(), id());
    return;
  }
  if (error)
    sendMessage(JsonRpcMessage::errorResponse(message.id(), *error));
  else
    sendMessage(JsonRpcMessage::response(message.id(), result));
}

auto Client::handleNotification(const JsonRpcMessage &message) -> void
{
  const auto method = message.method();
  if (method == Methods::logMessage || method == Methods::showMessage) {
    const auto params = message.params().toObject();
    const auto text = params.value("message").toString();
    switch (params.value("type").toInt()) {
    case 1: // Error
    case 2: // Warning
      qCWarning(LOGLSPCLIENT).noquote() << id() << ":" << text;
      break;
    case 3: // Info
      qCInfo(LOGLSPCLIENT).noquote() << id() << ":" << text;
      break;
    default:
      qCDebug(LOGLSPCLIENT).noquote() << id() << ":" << text;
      break;
    }
  } else if (method == Methods::publishDiagnostics || method == Methods::progress) {
    qCDebug(LOGLSPCLIENT) << id() << "received" << method;
    emit notificationReceived(method, message.params());
  } else {
    qCDebug(LOGLSPCLIENT) << id() << "ignoring notification" << method;
  }
}

auto Client::handleInterfaceError(const QString &message) -> void
{
  setError(LspError(LspError::FramingError, message, id()));
}

auto Client::handleInterfaceFinished() -> void
{
  const auto current = state();
  if (current == ShuttingDown || current == Stopped || current == Failed)
    return;
  setError(LspError(LspError::BackendTerminated, tr("The backend process exited unexpectedly: %1").arg(m_clientInterface->errorString()), id()));
}

} // namespace LspMux::LanguageClient
