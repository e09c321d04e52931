// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "applogging.hpp"

#include <languageclient/languageclient_global.hpp>
#include <languageclient/languageclientmanager.hpp>
#include <languageclient/languageclientsettings.hpp>

#include <QtCore/qcommandlineparser.h>
#include <QtCore/qcoreapplication.h>
#include <QtCore/qdir.h>
#include <QtCore/qjsonarray.h>
#include <QtCore/qjsondocument.h>
#include <QtCore/qtextstream.h>

using namespace LspMux::LanguageClient;

namespace LspMux {
namespace Internal {

Q_LOGGING_CATEGORY(appLog, "lspmux.app", QtInfoMsg)

// QJsonDocument only serializes objects and arrays, results may be any JSON value.
static auto jsonText(const QJsonValue &value) -> QString
{
  const auto wrapped = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
  return QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2));
}

static auto writeOutput(const QString &text) -> void
{
  QTextStream out(stdout);
  out << text << Qt::endl;
}

static auto createSettings(const QCommandLineParser &parser, QString *errorMessage) -> std::optional<LanguageClientSettings>
{
  const auto workspace = parser.isSet("workspace") ? QDir(parser.value("workspace")).absolutePath() : QDir::currentPath();
  LanguageClientSettings settings;
  if (parser.isSet("config")) {
    logDebug(QString("Loading configuration from %1").arg(parser.value("config")));
    if (!settings.load(parser.value("config"), errorMessage))
      return std::nullopt;
    if (parser.isSet("workspace") || settings.m_workspace.isEmpty())
      settings.m_workspace = workspace;
  } else if (parser.isSet("lsp-command")) {
    logDebug(QString("Using inline backend: %1").arg(parser.value("lsp-command")));
    settings = LanguageClientSettings::inlineSettings(parser.value("lsp-command"), workspace);
    if (!settings.validate(errorMessage))
      return std::nullopt;
  } else {
    logDebug(QString("Using the default configuration (pylsp)"));
    settings = LanguageClientSettings::defaultSettings(workspace);
  }
  if (parser.isSet("eager"))
    settings.m_eagerStart = true;
  return settings;
}

static auto invokeParams(const QCommandLineParser &parser, QString *errorMessage) -> std::optional<QJsonObject>
{
  QJsonObject params;
  if (parser.isSet("params")) {
    QJsonParseError error;
    const auto document = QJsonDocument::fromJson(parser.value("params").toUtf8(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
      *errorMessage = QCoreApplication::translate("lspmux", "--params expects a JSON object.");
      return std::nullopt;
    }
    params = document.object();
  }
  for (const auto &key : {QString("line"), QString("character")}) {
    if (!parser.isSet(key))
      continue;
    bool ok = false;
    const auto number = parser.value(key).toInt(&ok);
    if (!ok || number < 0) {
      *errorMessage = QCoreApplication::translate("lspmux", "--%1 expects a non-negative number.").arg(key);
      return std::nullopt;
    }
    params.insert(key, number);
  }
  if (parser.isSet("query"))
    params.insert("query", parser.value("query"));
  return params;
}

static auto runList(LanguageClientManager &manager) -> int
{
  QJsonArray backends;
  for (const auto &info : manager.backendInfos())
    backends.append(info.toJson());
  writeOutput(QString::fromUtf8(QJsonDocument(backends).toJson(QJsonDocument::Indented)).trimmed());
  return 0;
}

static auto runInvoke(LanguageClientManager &manager, const QCommandLineParser &parser, const QString &method) -> int
{
  QString errorMessage;
  const auto params = invokeParams(parser, &errorMessage);
  if (!params) {
    logError(errorMessage);
    return 1;
  }

  BackendSelector selector;
  selector.backendId = parser.value("backend");
  selector.filePath = parser.value("file");
  selector.languageId = parser.value("language");
  const auto reply = manager.invoke(selector, method, *params);
  if (reply.isError()) {
    logError(reply.error->toString());
    return 1;
  }
  writeOutput(jsonText(reply.rawResult));
  return 0;
}

} // namespace Internal
} // namespace LspMux

using namespace LspMux::Internal;

auto main(int argc, char *argv[]) -> int
{
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName(Constants::CLIENT_NAME);
  QCoreApplication::setApplicationVersion(Constants::CLIENT_VERSION);

  QCommandLineParser parser;
  parser.setApplicationDescription("Supervises language servers and routes LSP requests to them.");
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addOptions({
    {{"c", "config"}, "JSON configuration file.", "file"},
    {{"w", "workspace"}, "Workspace root (default: current directory).", "dir"},
    {"lsp-command", "Single language server command, e.g. \"pyright-langserver --stdio\".", "command"},
    {{"v", "verbose"}, "Enable debug logging."},
    {"eager", "Start all backends before serving."},
    {"file", "File the request refers to.", "path"},
    {"line", "Zero-based line.", "n"},
    {"character", "Zero-based character.", "n"},
    {"backend", "Backend id, overrides the routing by file.", "id"},
    {"language", "Language id hint.", "id"},
    {"query", "Query for workspace/symbol.", "text"},
    {"params", "Request params as JSON object.", "json"},
  });
  parser.addPositionalArgument("command", "list | invoke");
  parser.addPositionalArgument("method", "LSP method for invoke, e.g. textDocument/hover.", "[method]");
  parser.process(app);

  if (parser.isSet("verbose"))
    QLoggingCategory::setFilterRules("lspmux.*.debug=true\nlspmux.*.info=true");

  const auto positional = parser.positionalArguments();
  const auto command = positional.value(0);
  if (command != "list" && !(command == "invoke" && positional.size() == 2)) {
    logError(parser.helpText());
    return 1;
  }

  QString errorMessage;
  const auto settings = createSettings(parser, &errorMessage);
  if (!settings) {
    logError(errorMessage);
    return 1;
  }
  logDebug(QString("Workspace: %1").arg(settings->m_workspace));

  LanguageClientManager manager(*settings);
  logDebug(QString("Configured backends: %1").arg(manager.backendIds().join(", ")));
  if (settings->m_eagerStart) {
    for (const auto &error : manager.startAll())
      logWarn(error.toString());
  }

  const auto exitCode = command == "list" ? runList(manager) : runInvoke(manager, parser, positional.at(1));

  for (const auto &error : manager.stopAll())
    logWarn(error.toString());
  return exitCode;
}
