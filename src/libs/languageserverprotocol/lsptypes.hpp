// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageserverprotocol_global.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>

#include <optional>

namespace LspMux::LanguageServerProtocol {

class LSPMUX_PROTOCOL_EXPORT DocumentUri {
public:
  static auto fromFilePath(const QString &filePath) -> QString;
  static auto toFilePath(const QString &uri) -> QString;
};

class LSPMUX_PROTOCOL_EXPORT Position {
public:
  Position() = default;
  Position(int line, int character) : line(line), character(character) {}

  static auto fromJson(const QJsonValue &value) -> std::optional<Position>;
  auto toJson() const -> QJsonObject;

  auto operator==(const Position &other) const -> bool { return line == other.line && character == other.character; }

  int line = 0;
  int character = 0;
};

class LSPMUX_PROTOCOL_EXPORT Range {
public:
  Range() = default;
  Range(const Position &start, const Position &end) : start(start), end(end) {}

  static auto fromJson(const QJsonValue &value) -> std::optional<Range>;
  auto toJson() const -> QJsonObject;

  auto operator==(const Range &other) const -> bool { return start == other.start && end == other.end; }

  Position start;
  Position end;
};

class LSPMUX_PROTOCOL_EXPORT Location {
public:
  Location() = default;
  Location(const QString &uri, const Range &range) : uri(uri), range(range) {}

  // Accepts a Location as well as a LocationLink, which is reduced to its target.
  static auto fromJson(const QJsonValue &value) -> std::optional<Location>;
  auto toJson() const -> QJsonObject;
  auto filePath() const -> QString { return DocumentUri::toFilePath(uri); }

  auto operator==(const Location &other) const -> bool { return uri == other.uri && range == other.range; }

  QString uri;
  Range range;
};

class LSPMUX_PROTOCOL_EXPORT TextEdit {
public:
  static auto fromJson(const QJsonValue &value) -> std::optional<TextEdit>;
  auto toJson() const -> QJsonObject;

  Range range;
  QString newText;
};

class LSPMUX_PROTOCOL_EXPORT TextDocumentItem {
public:
  auto toJson() const -> QJsonObject;

  QString uri;
  QString languageId;
  int version = 1;
  QString text;
};

// Well-known language identifiers by file extension, empty if unknown.
LSPMUX_PROTOCOL_EXPORT auto languageIdForFile(const QString &filePath) -> QString;
LSPMUX_PROTOCOL_EXPORT auto textDocumentIdentifier(const QString &uri) -> QJsonObject;

} // namespace LspMux::LanguageServerProtocol
