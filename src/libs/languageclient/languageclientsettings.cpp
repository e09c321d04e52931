// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "languageclientsettings.hpp"

#include "client.hpp"
#include "languageclientinterface.hpp"

#include <utils/lspmuxassert.hpp>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QSet>

static Q_LOGGING_CATEGORY(settingsLog, "lspmux.languageclient.settings", QtWarningMsg);

namespace LspMux::LanguageClient {

constexpr char idKey[] = "id";
constexpr char commandKey[] = "command";
constexpr char argsKey[] = "args";
constexpr char extensionsKey[] = "extensions";
constexpr char languagesKey[] = "languages";
constexpr char workspaceKey[] = "workspace";
constexpr char initializationOptionsKey[] = "initializationOptions";
constexpr char enabledKey[] = "enabled";
constexpr char backendsKey[] = "backends";
constexpr char defaultBackendKey[] = "defaultBackend";
constexpr char eagerStartKey[] = "eagerStart";
constexpr char methodsKey[] = "methods";
constexpr char requestTimeoutKey[] = "requestTimeoutMs";
constexpr char startTimeoutKey[] = "startTimeoutMs";
constexpr char shutdownTimeoutKey[] = "shutdownTimeoutMs";
constexpr char exitGraceKey[] = "exitGraceMs";
// names used by configurations of the Python lsp-mcp server
constexpr char lspsKey[] = "lsps";
constexpr char eagerInitKey[] = "eager_init";

auto BackendSettings::command() const -> Utils::CommandLine
{
  return Utils::CommandLine(m_executable, m_arguments);
}

auto BackendSettings::isValid() const -> bool
{
  return !m_id.isEmpty() && !m_executable.isEmpty();
}

auto BackendSettings::toMap() const -> QVariantMap
{
  QVariantMap map;
  map.insert(idKey, m_id);
  map.insert(commandKey, m_executable);
  map.insert(argsKey, m_arguments);
  map.insert(extensionsKey, m_extensions);
  map.insert(languagesKey, m_languageIds);
  map.insert(workspaceKey, m_workspace);
  map.insert(initializationOptionsKey, m_initializationOptions.toVariantMap());
  map.insert(enabledKey, m_enabled);
  return map;
}

auto BackendSettings::fromMap(const QVariantMap &map) -> void
{
  m_id = map[idKey].toString();
  m_executable = map[commandKey].toString();
  m_arguments = map[argsKey].toStringList();
  m_extensions.clear();
  for (const auto &extension : map[extensionsKey].toStringList()) {
    const auto normalized = normalizedExtension(extension);
    if (!normalized.isEmpty() && !m_extensions.contains(normalized))
      m_extensions.append(normalized);
  }
  m_languageIds = map[languagesKey].toStringList();
  m_languageIds.removeAll(QString()); // remove empty entries
  m_workspace = map[workspaceKey].toString();
  m_initializationOptions = QJsonObject::fromVariantMap(map[initializationOptionsKey].toMap());
  m_enabled = map.value(enabledKey, true).toBool();
}

auto BackendSettings::createInterface() const -> BaseClientInterface*
{
  const auto interface = new StdIOClientInterface;
  interface->setCommandLine(command());
  interface->setWorkingDirectory(m_workspace);
  return interface;
}

auto BackendSettings::normalizedExtension(const QString &extension) -> QString
{
  const auto trimmed = extension.trimmed().toLower();
  if (trimmed.isEmpty() || trimmed == ".")
    return QString();
  return trimmed.startsWith('.') ? trimmed : '.' + trimmed;
}

auto BackendSettings::operator==(const BackendSettings &other) const -> bool
{
  return m_id == other.m_id && m_executable == other.m_executable && m_arguments == other.m_arguments && m_extensions == other.m_extensions && m_languageIds == other.m_languageIds && m_workspace == other.m_workspace && m_initializationOptions == other.m_initializationOptions && m_enabled == other.m_enabled;
}

auto LanguageClientSettings::toMap() const -> QVariantMap
{
  QVariantMap map;
  QVariantList backends;
  for (const auto &backend : m_backends)
    backends.append(backend.toMap());
  map.insert(backendsKey, backends);
  map.insert(workspaceKey, m_workspace);
  map.insert(defaultBackendKey, m_defaultBackend);
  map.insert(eagerStartKey, m_eagerStart);
  map.insert(methodsKey, m_methods);
  map.insert(requestTimeoutKey, m_requestTimeoutMs);
  map.insert(startTimeoutKey, m_startTimeoutMs);
  map.insert(shutdownTimeoutKey, m_shutdownTimeoutMs);
  map.insert(exitGraceKey, m_exitGraceMs);
  return map;
}

auto LanguageClientSettings::fromMap(const QVariantMap &map) -> void
{
  m_backends.clear();
  const auto backends = map.contains(backendsKey) ? map[backendsKey] : map[lspsKey];
  for (const auto &var : backends.toList()) {
    BackendSettings backend;
    backend.fromMap(var.toMap());
    m_backends.append(backend);
  }
  m_workspace = map[workspaceKey].toString();
  m_defaultBackend = map[defaultBackendKey].toString();
  m_eagerStart = map.contains(eagerStartKey) ? map[eagerStartKey].toBool() : map[eagerInitKey].toBool();
  m_methods = map[methodsKey].toStringList();
  m_requestTimeoutMs = map.value(requestTimeoutKey, Constants::DEFAULT_REQUEST_TIMEOUT_MS).toInt();
  m_startTimeoutMs = map.value(startTimeoutKey, Constants::DEFAULT_START_TIMEOUT_MS).toInt();
  m_shutdownTimeoutMs = map.value(shutdownTimeoutKey, Constants::DEFAULT_SHUTDOWN_TIMEOUT_MS).toInt();
  m_exitGraceMs = map.value(exitGraceKey, Constants::DEFAULT_EXIT_GRACE_MS).toInt();
}

auto LanguageClientSettings::fromJson(const QByteArray &json, QString *errorMessage) -> bool
{
  QJsonParseError error;
  const auto document = QJsonDocument::fromJson(json, &error);
  if (error.error != QJsonParseError::NoError) {
    if (errorMessage)
      *errorMessage = tr("Invalid configuration: %1 at offset %2.").arg(error.errorString()).arg(error.offset);
    return false;
  }
  if (!document.isObject()) {
    if (errorMessage)
      *errorMessage = tr("Invalid configuration: the top level must be a JSON object.");
    return false;
  }
  fromMap(document.object().toVariantMap());
  return validate(errorMessage);
}

auto LanguageClientSettings::toJson() const -> QByteArray
{
  return QJsonDocument(QJsonObject::fromVariantMap(toMap())).toJson();
}

auto LanguageClientSettings::load(const QString &filePath, QString *errorMessage) -> bool
{
  QFile file(filePath);
  if (!file.exists()) {
    if (errorMessage)
      *errorMessage = tr("Configuration file not found: %1").arg(QDir::toNativeSeparators(filePath));
    return false;
  }
  if (!file.open(QIODevice::ReadOnly)) {
    if (errorMessage)
      *errorMessage = tr("Cannot read configuration file %1: %2").arg(QDir::toNativeSeparators(filePath), file.errorString());
    return false;
  }
  qCDebug(settingsLog) << "loading configuration from" << filePath;
  return fromJson(file.readAll(), errorMessage);
}

auto LanguageClientSettings::validate(QString *errorMessage) const -> bool
{
  auto fail = [errorMessage](const QString &message) {
    if (errorMessage)
      *errorMessage = message;
    return false;
  };

  QSet<QString> ids;
  QSet<QString> disabledIds;
  for (const auto &backend : m_backends) {
    if (backend.m_id.isEmpty())
      return fail(tr("A backend has no id."));
    if (ids.contains(backend.m_id))
      return fail(tr("The backend id \"%1\" is used more than once.").arg(backend.m_id));
    ids.insert(backend.m_id);
    if (!backend.m_enabled)
      disabledIds.insert(backend.m_id);
    if (backend.m_executable.isEmpty())
      return fail(tr("The backend \"%1\" has no command.").arg(backend.m_id));
  }
  if (!m_defaultBackend.isEmpty() && !ids.contains(m_defaultBackend))
    return fail(tr("The default backend \"%1\" is not configured.").arg(m_defaultBackend));
  if (disabledIds.contains(m_defaultBackend))
    return fail(tr("The default backend \"%1\" is disabled.").arg(m_defaultBackend));
  if (m_requestTimeoutMs <= 0 || m_startTimeoutMs <= 0 || m_shutdownTimeoutMs <= 0 || m_exitGraceMs < 0)
    return fail(tr("Timeouts must be positive."));
  return true;
}

auto LanguageClientSettings::enabledBackends() const -> QList<BackendSettings>
{
  QList<BackendSettings> result;
  for (const auto &backend : m_backends) {
    if (backend.m_enabled)
      result.append(backend);
    else
      qCDebug(settingsLog) << "skipping disabled backend" << backend.m_id;
  }
  return result;
}

auto LanguageClientSettings::workspaceFor(const BackendSettings &backend) const -> QString
{
  const auto workspace = backend.m_workspace.isEmpty() ? m_workspace : backend.m_workspace;
  if (workspace.isEmpty())
    return QDir::currentPath();
  return QDir::cleanPath(QDir(workspace).absolutePath());
}

auto LanguageClientSettings::createClient(const BackendSettings &backend) const -> Client*
{
  LSPMUX_ASSERT(backend.isValid(), return nullptr);
  auto resolved = backend;
  resolved.m_workspace = workspaceFor(backend);
  const auto client = new Client(resolved, resolved.createInterface());
  client->setRequestTimeout(m_requestTimeoutMs);
  client->setStartTimeout(m_startTimeoutMs);
  client->setShutdownTimeout(m_shutdownTimeoutMs);
  client->setExitGrace(m_exitGraceMs);
  return client;
}

auto LanguageClientSettings::defaultSettings(const QString &workspace) -> LanguageClientSettings
{
  BackendSettings pylsp;
  pylsp.m_id = "pylsp";
  pylsp.m_executable = "pylsp";
  pylsp.m_extensions = QStringList{".py", ".pyi"};
  pylsp.m_languageIds = QStringList{"python"};

  LanguageClientSettings settings;
  settings.m_backends.append(pylsp);
  settings.m_workspace = workspace;
  return settings;
}

auto LanguageClientSettings::inlineSettings(const QString &commandLine, const QString &workspace) -> LanguageClientSettings
{
  const auto command = Utils::CommandLine::fromUserInput(commandLine);
  BackendSettings backend;
  backend.m_id = Constants::INLINE_BACKEND_ID;
  backend.m_executable = command.executable();
  backend.m_arguments = command.arguments();
  backend.m_extensions = QStringList{".py", ".pyi"};
  backend.m_languageIds = QStringList{"python"};

  LanguageClientSettings settings;
  settings.m_backends.append(backend);
  settings.m_workspace = workspace;
  return settings;
}

} // namespace LspMux::LanguageClient
