// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "languageclientmanager.hpp"

#include <languageserverprotocol/lsptypes.hpp>
#include <languageserverprotocol/servercapabilities.hpp>

#include <utils/lspmuxassert.hpp>

#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QtConcurrent>

using namespace LspMux::LanguageServerProtocol;

static Q_LOGGING_CATEGORY(Log, "lspmux.languageclient.manager", QtWarningMsg)

namespace LspMux::LanguageClient {

constexpr char textDocumentKey[] = "textDocument";
constexpr char positionKey[] = "position";
constexpr char lineKey[] = "line";
constexpr char characterKey[] = "character";
constexpr char contextKey[] = "context";
constexpr char includeDeclarationKey[] = "includeDeclaration";
constexpr char queryKey[] = "query";
constexpr char textDocumentMethodPrefix[] = "textDocument/";
constexpr char uriKey[] = "uri";

static auto absoluteFilePath(const QString &filePath) -> QString
{
  return QDir::cleanPath(QFileInfo(filePath).absoluteFilePath());
}

auto BackendSelector::forBackend(const QString &backendId) -> BackendSelector
{
  BackendSelector selector;
  selector.backendId = backendId;
  return selector;
}

auto BackendSelector::forFile(const QString &filePath, const QString &languageId) -> BackendSelector
{
  BackendSelector selector;
  selector.filePath = filePath;
  selector.languageId = languageId;
  return selector;
}

auto BackendSelector::forLanguage(const QString &languageId) -> BackendSelector
{
  BackendSelector selector;
  selector.languageId = languageId;
  return selector;
}

auto BackendInfo::toJson() const -> QJsonObject
{
  QJsonObject object{
    {"id", id},
    {"command", command.toUserOutput()},
    {"languages", QJsonArray::fromStringList(languageIds)},
    {"extensions", QJsonArray::fromStringList(extensions)},
    {"state", Client::stateString(state)},
  };
  if (!serverName.isEmpty())
    object.insert("serverName", serverName);
  if (!serverVersion.isEmpty())
    object.insert("serverVersion", serverVersion);
  if (!capabilities.isEmpty())
    object.insert("capabilities", capabilities);
  return object;
}

LanguageClientManager::LanguageClientManager(const LanguageClientSettings &settings, QObject *parent) : LanguageClientManager(settings, ClientFactory(), parent) {}

LanguageClientManager::LanguageClientManager(const LanguageClientSettings &settings, const ClientFactory &factory, QObject *parent) : QObject(parent), m_settings(settings), m_factory(factory)
{
  if (!m_factory) {
    m_factory = [this](const BackendSettings &backend) {
      return m_settings.createClient(backend);
    };
  }

  // later backends win for shared extensions and languages
  for (const auto &backend : m_settings.enabledBackends()) {
    LSPMUX_ASSERT(!m_backendSettings.contains(backend.m_id), continue);
    m_backendOrder.append(backend.m_id);
    m_backendSettings.insert(backend.m_id, backend);
    for (const auto &extension : backend.m_extensions) {
      const auto normalized = BackendSettings::normalizedExtension(extension);
      if (m_backendForExtension.contains(normalized))
        qCDebug(Log) << "extension" << normalized << "moves from" << m_backendForExtension.value(normalized) << "to" << backend.m_id;
      m_backendForExtension.insert(normalized, backend.m_id);
    }
    for (const auto &languageId : backend.m_languageIds)
      m_backendForLanguage.insert(languageId, backend.m_id);
    m_clients.insert(backend.m_id, createClient(backend));
  }
  qCDebug(Log) << "configured backends:" << m_backendOrder;
}

LanguageClientManager::~LanguageClientManager()
{
  // the clients kill their processes when they are destroyed
  QMutexLocker locker(&m_clientsMutex);
  m_clients.clear();
}

auto LanguageClientManager::createClient(const BackendSettings &backend) -> QSharedPointer<Client>
{
  QSharedPointer<Client> client(m_factory(backend));
  LSPMUX_ASSERT(client, return client);
  const auto backendId = backend.m_id;
  connect(client.data(), &Client::notificationReceived, this, [this, backendId](const QString &method, const QJsonValue &params) {
    emit notificationReceived(backendId, method, params);
  });
  return client;
}

auto LanguageClientManager::client(const QString &backendId) const -> QSharedPointer<Client>
{
  QMutexLocker locker(&m_clientsMutex);
  return m_clients.value(backendId);
}

auto LanguageClientManager::clients() const -> QList<QSharedPointer<Client>>
{
  QList<QSharedPointer<Client>> result;
  QMutexLocker locker(&m_clientsMutex);
  for (const auto &backendId : m_backendOrder)
    result.append(m_clients.value(backendId));
  return result;
}

auto LanguageClientManager::resolveBackend(const BackendSelector &selector, LspError *error) const -> QString
{
  auto fail = [error](LspError::Kind kind, const QString &message) {
    if (error)
      *error = LspError(kind, message);
    return QString();
  };

  if (!selector.backendId.isEmpty()) {
    if (!m_backendSettings.contains(selector.backendId))
      return fail(LspError::UnknownBackend, tr("Unknown backend \"%1\". Configured: %2.").arg(selector.backendId, m_backendOrder.join(", ")));
    return selector.backendId;
  }

  if (!selector.filePath.isEmpty()) {
    const auto extension = BackendSettings::normalizedExtension(QFileInfo(selector.filePath).suffix());
    const auto backendId = m_backendForExtension.value(extension);
    if (!backendId.isEmpty())
      return backendId;
  }

  if (!selector.languageId.isEmpty()) {
    const auto backendId = m_backendForLanguage.value(selector.languageId);
    if (!backendId.isEmpty())
      return backendId;
  }

  if (selector.isWorkspaceScope()) {
    if (!m_settings.m_defaultBackend.isEmpty()) {
      if (!m_backendSettings.contains(m_settings.m_defaultBackend))
        return fail(LspError::UnknownBackend, tr("The default backend \"%1\" is not available.").arg(m_settings.m_defaultBackend));
      return m_settings.m_defaultBackend;
    }
    if (!m_backendOrder.isEmpty())
      return m_backendOrder.first();
    return fail(LspError::NoBackendForFile, tr("No backend is configured."));
  }

  if (!selector.filePath.isEmpty())
    return fail(LspError::NoBackendForFile, tr("No backend handles \"%1\".").arg(QDir::toNativeSeparators(selector.filePath)));
  return fail(LspError::NoBackendForFile, tr("No backend handles the language \"%1\".").arg(selector.languageId));
}

auto LanguageClientManager::isMethodAllowed(const QString &method) const -> bool
{
  return m_settings.m_methods.isEmpty() || m_settings.m_methods.contains(method);
}

auto LanguageClientManager::languageIdFor(const BackendSettings &backend, const QString &hint, const QString &filePath) -> QString
{
  if (!hint.isEmpty())
    return hint;
  if (!backend.m_languageIds.isEmpty())
    return backend.m_languageIds.first();
  const auto languageId = languageIdForFile(filePath);
  return languageId.isEmpty() ? QString("plaintext") : languageId;
}

auto LanguageClientManager::documentParams(const QString &method, const QString &filePath, const QJsonObject &params) -> QJsonObject
{
  QJsonObject result = params;
  if (!result.contains(textDocumentKey)) {
    result.insert(textDocumentKey, textDocumentIdentifier(DocumentUri::fromFilePath(filePath)));
    if (params.contains(lineKey) || params.contains(characterKey)) {
      const Position position(params.value(lineKey).toInt(), params.value(characterKey).toInt());
      result.insert(positionKey, position.toJson());
    }
    result.remove(lineKey);
    result.remove(characterKey);
  }
  if (method == Methods::references && !result.contains(contextKey))
    result.insert(contextKey, QJsonObject{{includeDeclarationKey, params.value(includeDeclarationKey).toBool(true)}});
  result.remove(includeDeclarationKey);
  return result;
}

auto LanguageClientManager::invoke(const BackendSelector &selector, const QString &method, const QJsonObject &params) -> InvokeReply
{
  InvokeReply reply;
  auto fail = [&reply](const LspError &error) {
    qCDebug(Log).noquote() << "invoke failed:" << error.toString();
    reply.error = error;
    return reply;
  };

  if (!isMethodAllowed(method))
    return fail(LspError(LspError::MethodDisabled, tr("The method \"%1\" is not enabled.").arg(method), {}, method));

  LspError resolveError;
  const auto backendId = resolveBackend(selector, &resolveError);
  if (backendId.isEmpty())
    return fail(resolveError.withContext({}, method));
  reply.backendId = backendId;
  const auto client = this->client(backendId);
  LSPMUX_ASSERT(client, return fail(LspError(LspError::UnknownBackend, tr("The backend has no client."), backendId, method)));
  qCDebug(Log) << "routing" << method << "to" << backendId;

  if (const auto cause = client->failure())
    return fail(LspError(cause->kind, cause->message, backendId, method));
  if (const auto error = client->ensureStarted())
    return fail(error->withContext(backendId, method));

  if (!client->supportsMethod(method)) {
    const auto capability = ServerCapabilities::capabilityForMethod(method);
    return fail(LspError(LspError::CapabilityUnsupported, tr("The backend does not provide \"%1\".").arg(capability), backendId, method));
  }

  auto lspParams = params;
  if (method.startsWith(textDocumentMethodPrefix)) {
    // the document that gets opened has to be the one the request refers to
    const auto uri = params.value(textDocumentKey).toObject().value(uriKey).toString();
    const auto uriPath = DocumentUri::toFilePath(uri);
    if (!uri.isEmpty() && uriPath.isEmpty())
      return fail(LspError(LspError::DocumentError, tr("Not a file URI: %1").arg(uri), backendId, method));
    if (!selector.filePath.isEmpty() && !uriPath.isEmpty() && absoluteFilePath(selector.filePath) != absoluteFilePath(uriPath)) {
      return fail(LspError(LspError::DocumentError, tr("The file \"%1\" does not match the document %2.").arg(QDir::toNativeSeparators(selector.filePath), uri), backendId, method));
    }
    const auto filePath = selector.filePath.isEmpty() ? uriPath : selector.filePath;
    if (filePath.isEmpty())
      return fail(LspError(LspError::DocumentError, tr("The method \"%1\" needs a file.").arg(method), backendId, method));
    const QFileInfo fileInfo(filePath);
    if (!fileInfo.exists())
      return fail(LspError(LspError::DocumentError, tr("File not found: %1").arg(QDir::toNativeSeparators(filePath)), backendId, method));
    if (!fileInfo.isFile())
      return fail(LspError(LspError::DocumentError, tr("Not a file: %1").arg(QDir::toNativeSeparators(filePath)), backendId, method));
    const auto absolutePath = absoluteFilePath(filePath);

    const auto languageId = languageIdFor(client->settings(), selector.languageId, absolutePath);
    if (const auto error = client->ensureDocumentOpen(absolutePath, languageId))
      return fail(error->withContext(backendId, method));
    lspParams = documentParams(method, absolutePath, params);
    if (!uri.isEmpty()) {
      // same spelling as in didOpen
      auto textDocument = lspParams.value(textDocumentKey).toObject();
      textDocument.insert(uriKey, DocumentUri::fromFilePath(absolutePath));
      lspParams.insert(textDocumentKey, textDocument);
    }
  } else if (method == Methods::workspaceSymbol && !lspParams.contains(queryKey)) {
    lspParams.insert(queryKey, QString());
  }

  const auto response = client->request(method, lspParams);
  if (response.isError())
    return fail(response.error()->withContext(backendId, method));

  reply.rawResult = response.result();
  QString decodeError;
  reply.result = ResultDecoder::decode(method, reply.rawResult, &decodeError);
  if (!reply.result)
    return fail(LspError(LspError::MalformedResponse, decodeError, backendId, method));
  return reply;
}

auto LanguageClientManager::startAll() -> QList<LspError>
{
  QList<QFuture<std::optional<LspError>>> futures;
  for (const auto &client : clients())
    futures.append(QtConcurrent::run([client] { return client->ensureStarted(); }));

  QList<LspError> errors;
  for (auto &future : futures) {
    future.waitForFinished();
    if (const auto error = future.result())
      errors.append(*error);
  }
  for (const auto &error : errors)
    qCWarning(Log).noquote() << "start failed:" << error.toString();
  return errors;
}

auto LanguageClientManager::stopAll() -> QList<LspError>
{
  qCDebug(Log) << "shutdown manager";
  // each stop may wait for timeouts, so all backends are stopped in parallel
  QList<QFuture<std::optional<LspError>>> futures;
  for (const auto &client : clients())
    futures.append(QtConcurrent::run([client] { return client->stop(); }));

  QList<LspError> errors;
  for (auto &future : futures) {
    future.waitForFinished();
    if (const auto error = future.result())
      errors.append(*error);
  }
  return errors;
}

auto LanguageClientManager::restartBackend(const QString &backendId) -> std::optional<LspError>
{
  const auto old = client(backendId);
  if (!old)
    return LspError(LspError::UnknownBackend, tr("Unknown backend \"%1\".").arg(backendId), backendId);

  qCDebug(Log) << "restart backend" << backendId;
  const auto error = old->stop();
  const auto fresh = createClient(m_backendSettings.value(backendId));
  {
    QMutexLocker locker(&m_clientsMutex);
    m_clients.insert(backendId, fresh);
  }
  // requests still running on the old client keep it alive until they finish
  return error;
}

auto LanguageClientManager::backendInfos() const -> QList<BackendInfo>
{
  QList<BackendInfo> infos;
  for (const auto &backendId : m_backendOrder) {
    const auto &backend = m_backendSettings[backendId];
    BackendInfo info;
    info.id = backendId;
    info.command = backend.command();
    info.languageIds = backend.m_languageIds;
    info.extensions = backend.m_extensions;
    if (const auto client = this->client(backendId)) {
      info.state = client->state();
      info.serverName = client->serverName();
      info.serverVersion = client->serverVersion();
      info.capabilities = client->capabilities().toJson();
    }
    infos.append(info);
  }
  return infos;
}

} // namespace LspMux::LanguageClient
