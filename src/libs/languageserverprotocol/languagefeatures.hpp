// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageserverprotocol_global.hpp"

#include "lsptypes.hpp"

#include <QCoreApplication>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>

#include <cstddef>
#include <optional>
#include <variant>

namespace LspMux::LanguageServerProtocol {

namespace Methods {
constexpr char initialize[] = "initialize";
constexpr char initialized[] = "initialized";
constexpr char shutdown[] = "shutdown";
constexpr char exit[] = "exit";
constexpr char didOpen[] = "textDocument/didOpen";
constexpr char didClose[] = "textDocument/didClose";
constexpr char hover[] = "textDocument/hover";
constexpr char definition[] = "textDocument/definition";
constexpr char declaration[] = "textDocument/declaration";
constexpr char typeDefinition[] = "textDocument/typeDefinition";
constexpr char implementation[] = "textDocument/implementation";
constexpr char references[] = "textDocument/references";
constexpr char documentSymbol[] = "textDocument/documentSymbol";
constexpr char completion[] = "textDocument/completion";
constexpr char rename[] = "textDocument/rename";
constexpr char workspaceSymbol[] = "workspace/symbol";
constexpr char logMessage[] = "window/logMessage";
constexpr char showMessage[] = "window/showMessage";
constexpr char publishDiagnostics[] = "textDocument/publishDiagnostics";
constexpr char progress[] = "$/progress";
constexpr char registerCapability[] = "client/registerCapability";
constexpr char unregisterCapability[] = "client/unregisterCapability";
constexpr char workspaceConfiguration[] = "workspace/configuration";
constexpr char workspaceFolders[] = "workspace/workspaceFolders";
constexpr char workDoneProgressCreate[] = "window/workDoneProgress/create";
} // namespace Methods

class LSPMUX_PROTOCOL_EXPORT MarkupContent {
public:
  QString kind; // "markdown" or "plaintext"
  QString language; // set for MarkedString code blocks
  QString value;
};

class LSPMUX_PROTOCOL_EXPORT Hover {
public:
  QList<MarkupContent> contents;
  std::optional<Range> range;
};

class LSPMUX_PROTOCOL_EXPORT SymbolInformation {
public:
  QString name;
  int kind = 0;
  QString containerName;
  Location location;
};

class LSPMUX_PROTOCOL_EXPORT DocumentSymbol {
public:
  QString name;
  QString detail;
  int kind = 0;
  Range range;
  Range selectionRange;
  QList<DocumentSymbol> children;
};

class LSPMUX_PROTOCOL_EXPORT CompletionItem {
public:
  QString label;
  std::optional<int> kind;
  QString detail;
  QString documentation;
  QString insertText;
  QString sortText;
  QString filterText;
};

class LSPMUX_PROTOCOL_EXPORT CompletionList {
public:
  bool isIncomplete = false;
  QList<CompletionItem> items;
};

class LSPMUX_PROTOCOL_EXPORT WorkspaceEdit {
public:
  // document changes are folded into this map, keyed by document uri
  QMap<QString, QList<TextEdit>> changes;
};

// A response result decoded by the method that produced it. Methods without a dedicated decoder,
// and results the protocol allows to be anything, keep their raw JSON value.
using LspResult = std::variant<std::nullptr_t, Hover, QList<Location>, QList<SymbolInformation>,
                               QList<DocumentSymbol>, CompletionList, WorkspaceEdit, QJsonValue>;

class LSPMUX_PROTOCOL_EXPORT ResultDecoder {
  Q_DECLARE_TR_FUNCTIONS(ResultDecoder)

public:
  static auto decode(const QString &method, const QJsonValue &result, QString *errorMessage) -> std::optional<LspResult>;

  static auto decodeHover(const QJsonValue &result) -> std::optional<Hover>;
  static auto decodeLocations(const QJsonValue &result) -> std::optional<QList<Location>>;
  static auto decodeSymbolInformation(const QJsonValue &result) -> std::optional<QList<SymbolInformation>>;
  static auto decodeDocumentSymbols(const QJsonValue &result) -> std::optional<QList<DocumentSymbol>>;
  static auto decodeCompletion(const QJsonValue &result) -> std::optional<CompletionList>;
  static auto decodeWorkspaceEdit(const QJsonValue &result) -> std::optional<WorkspaceEdit>;
};

} // namespace LspMux::LanguageServerProtocol
