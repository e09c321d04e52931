// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageclient_global.hpp"

#include <utils/commandline.hpp>

#include <QCoreApplication>
#include <QJsonObject>
#include <QList>
#include <QStringList>
#include <QVariantMap>

namespace LspMux::LanguageClient {

class Client;
class BaseClientInterface;

// One language server to supervise: how to start it and which files it serves.
class LSPMUX_CLIENT_EXPORT BackendSettings {
public:
  BackendSettings() = default;

  QString m_id;
  QString m_executable;
  QStringList m_arguments;
  QStringList m_extensions;
  QStringList m_languageIds;
  QString m_workspace;
  QJsonObject m_initializationOptions;
  bool m_enabled = true;

  auto command() const -> Utils::CommandLine;
  auto isValid() const -> bool;
  auto toMap() const -> QVariantMap;
  auto fromMap(const QVariantMap &map) -> void;
  auto createInterface() const -> BaseClientInterface*;

  // ".PY", "py" and ".py" all become ".py".
  static auto normalizedExtension(const QString &extension) -> QString;

  auto operator==(const BackendSettings &other) const -> bool;
  auto operator!=(const BackendSettings &other) const -> bool { return !(*this == other); }
};

class LSPMUX_CLIENT_EXPORT LanguageClientSettings {
  Q_DECLARE_TR_FUNCTIONS(LanguageClientSettings)

public:
  LanguageClientSettings() = default;

  QList<BackendSettings> m_backends;
  QString m_workspace;
  QString m_defaultBackend;
  bool m_eagerStart = false;
  // empty allows every method
  QStringList m_methods;
  int m_requestTimeoutMs = Constants::DEFAULT_REQUEST_TIMEOUT_MS;
  int m_startTimeoutMs = Constants::DEFAULT_START_TIMEOUT_MS;
  int m_shutdownTimeoutMs = Constants::DEFAULT_SHUTDOWN_TIMEOUT_MS;
  int m_exitGraceMs = Constants::DEFAULT_EXIT_GRACE_MS;

  auto toMap() const -> QVariantMap;
  auto fromMap(const QVariantMap &map) -> void;
  auto fromJson(const QByteArray &json, QString *errorMessage) -> bool;
  auto toJson() const -> QByteArray;
  auto load(const QString &filePath, QString *errorMessage) -> bool;
  auto validate(QString *errorMessage) const -> bool;

  auto enabledBackends() const -> QList<BackendSettings>;
  // The backend's own workspace, else the global one.
  auto workspaceFor(const BackendSettings &backend) const -> QString;
  auto createClient(const BackendSettings &backend) const -> Client*;

  // One pylsp backend for Python files.
  static auto defaultSettings(const QString &workspace) -> LanguageClientSettings;
  // One backend with the id "inline" built from a command line like "pyright-langserver --stdio".
  static auto inlineSettings(const QString &commandLine, const QString &workspace) -> LanguageClientSettings;
};

} // namespace LspMux::LanguageClient
