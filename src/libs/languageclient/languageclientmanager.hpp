// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "client.hpp"
#include "languageclient_global.hpp"
#include "languageclientsettings.hpp"
#include "lsperror.hpp"

#include <languageserverprotocol/languagefeatures.hpp>

#include <QHash>
#include <QJsonObject>
#include <QMutex>
#include <QSharedPointer>
#include <QStringList>

#include <functional>
#include <optional>

namespace LspMux::LanguageClient {

// Selects the backend of a request. An explicit id wins over the file, the file extension over
// the language hint. Without any of them the request is workspace scoped.
class LSPMUX_CLIENT_EXPORT BackendSelector {
public:
  static auto forBackend(const QString &backendId) -> BackendSelector;
  static auto forFile(const QString &filePath, const QString &languageId = {}) -> BackendSelector;
  static auto forLanguage(const QString &languageId) -> BackendSelector;
  static auto workspace() -> BackendSelector { return {}; }

  auto isWorkspaceScope() const -> bool { return backendId.isEmpty() && filePath.isEmpty() && languageId.isEmpty(); }

  QString backendId;
  QString filePath;
  QString languageId;
};

class LSPMUX_CLIENT_EXPORT InvokeReply {
public:
  auto isError() const -> bool { return error.has_value(); }

  QString backendId;
  QJsonValue rawResult;
  std::optional<LanguageServerProtocol::LspResult> result;
  std::optional<LspError> error;
};

class LSPMUX_CLIENT_EXPORT BackendInfo {
public:
  auto toJson() const -> QJsonObject;

  QString id;
  Utils::CommandLine command;
  QStringList languageIds;
  QStringList extensions;
  Client::State state = Client::NotStarted;
  QString serverName;
  QString serverVersion;
  QJsonObject capabilities;
};

// Owns one Client per configured backend and routes requests to them. Independent instances may
// coexist. All public functions are thread-safe.
class LSPMUX_CLIENT_EXPORT LanguageClientManager : public QObject {
  Q_OBJECT

public:
  using ClientFactory = std::function<Client*(const BackendSettings &settings)>;

  explicit LanguageClientManager(const LanguageClientSettings &settings, QObject *parent = nullptr);
  // The factory creates the clients, the manager takes ownership of them.
  LanguageClientManager(const LanguageClientSettings &settings, const ClientFactory &factory, QObject *parent = nullptr);
  LanguageClientManager(const LanguageClientManager &other) = delete;
  LanguageClientManager(LanguageClientManager &&other) = delete;
  ~LanguageClientManager() override;

  auto operator=(const LanguageClientManager &) -> LanguageClientManager& = delete;
  auto operator=(LanguageClientManager &&) -> LanguageClientManager& = delete;

  auto settings() const -> const LanguageClientSettings& { return m_settings; }
  auto backendIds() const -> QStringList { return m_backendOrder; }
  auto client(const QString &backendId) const -> QSharedPointer<Client>;
  // Returns the id of the selected backend, or an empty string and the reason in error.
  auto resolveBackend(const BackendSelector &selector, LspError *error) const -> QString;
  auto isMethodAllowed(const QString &method) const -> bool;

  auto invoke(const BackendSelector &selector, const QString &method, const QJsonObject &params) -> InvokeReply;
  auto startAll() -> QList<LspError>;
  // Stops every backend, also when some of them fail to stop.
  auto stopAll() -> QList<LspError>;
  auto restartBackend(const QString &backendId) -> std::optional<LspError>;
  auto backendInfos() const -> QList<BackendInfo>;

  // The LSP params for a document request: positional data ("line", "character",
  // "includeDeclaration") is converted, params already in LSP form are passed through.
  static auto documentParams(const QString &method, const QString &filePath, const QJsonObject &params) -> QJsonObject;
  static auto languageIdFor(const BackendSettings &backend, const QString &hint, const QString &filePath) -> QString;

signals:
  auto notificationReceived(const QString &backendId, const QString &method, const QJsonValue &params) -> void;

private:
  auto createClient(const BackendSettings &backend) -> QSharedPointer<Client>;
  auto clients() const -> QList<QSharedPointer<Client>>;

  const LanguageClientSettings m_settings;
  ClientFactory m_factory;
  QStringList m_backendOrder;
  QHash<QString, BackendSettings> m_backendSettings;
  QHash<QString, QString> m_backendForExtension;
  QHash<QString, QString> m_backendForLanguage;
  mutable QMutex m_clientsMutex;
  QHash<QString, QSharedPointer<Client>> m_clients;
};

} // namespace LspMux::LanguageClient
