// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "servercapabilities.hpp"

#include <QHash>
#include <QStringList>

namespace LspMux::LanguageServerProtocol {

auto ServerCapabilities::value(const QString &path) const -> QJsonValue
{
  QJsonValue current = m_capabilities;
  for (const auto &segment : path.split('.')) {
    if (!current.isObject())
      return QJsonValue(QJsonValue::Undefined);
    current = current.toObject().value(segment);
  }
  return current;
}

auto ServerCapabilities::has(const QString &path) const -> bool
{
  return isPresent(value(path));
}

auto ServerCapabilities::isPresent(const QJsonValue &value) -> bool
{
  if (value.isUndefined() || value.isNull())
    return false;
  if (value.isBool())
    return value.toBool();
  return true;
}

auto ServerCapabilities::sendsOpenClose() const -> bool
{
  const auto openClose = value("textDocumentSync.openClose");
  return !(openClose.isBool() && !openClose.toBool());
}

auto ServerCapabilities::capabilityForMethod(const QString &method) -> QString
{
  static const QHash<QString, QString> capabilities = {
    {"textDocument/hover", "hoverProvider"},
    {"textDocument/definition", "definitionProvider"},
    {"textDocument/declaration", "declarationProvider"},
    {"textDocument/typeDefinition", "typeDefinitionProvider"},
    {"textDocument/implementation", "implementationProvider"},
    {"textDocument/references", "referencesProvider"},
    {"textDocument/documentSymbol", "documentSymbolProvider"},
    {"textDocument/documentHighlight", "documentHighlightProvider"},
    {"textDocument/completion", "completionProvider"},
    {"completionItem/resolve", "completionProvider.resolveProvider"},
    {"textDocument/signatureHelp", "signatureHelpProvider"},
    {"textDocument/codeAction", "codeActionProvider"},
    {"textDocument/codeLens", "codeLensProvider"},
    {"textDocument/formatting", "documentFormattingProvider"},
    {"textDocument/rangeFormatting", "documentRangeFormattingProvider"},
    {"textDocument/rename", "renameProvider"},
    {"textDocument/prepareRename", "renameProvider.prepareProvider"},
    {"textDocument/foldingRange", "foldingRangeProvider"},
    {"textDocument/semanticTokens/full", "semanticTokensProvider"},
    {"workspace/symbol", "workspaceSymbolProvider"},
    {"workspace/executeCommand", "executeCommandProvider"},
  };
  return capabilities.value(method);
}

} // namespace LspMux::LanguageServerProtocol
