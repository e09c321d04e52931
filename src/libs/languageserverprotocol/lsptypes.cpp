// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "lsptypes.hpp"

#include <QFileInfo>
#include <QHash>
#include <QUrl>

namespace LspMux::LanguageServerProtocol {

constexpr char lineKey[] = "line";
constexpr char characterKey[] = "character";
constexpr char startKey[] = "start";
constexpr char endKey[] = "end";
constexpr char uriKey[] = "uri";
constexpr char rangeKey[] = "range";
constexpr char targetUriKey[] = "targetUri";
constexpr char targetRangeKey[] = "targetRange";
constexpr char targetSelectionRangeKey[] = "targetSelectionRange";
constexpr char newTextKey[] = "newText";
constexpr char languageIdKey[] = "languageId";
constexpr char versionKey[] = "version";
constexpr char textKey[] = "text";

auto DocumentUri::fromFilePath(const QString &filePath) -> QString
{
  return QUrl::fromLocalFile(filePath).toString(QUrl::FullyEncoded);
}

auto DocumentUri::toFilePath(const QString &uri) -> QString
{
  const QUrl url(uri);
  return url.isLocalFile() ? url.toLocalFile() : QString();
}

auto Position::fromJson(const QJsonValue &value) -> std::optional<Position>
{
  const auto object = value.toObject();
  const auto line = object.value(lineKey);
  const auto character = object.value(characterKey);
  if (!line.isDouble() || !character.isDouble())
    return std::nullopt;
  return Position(line.toInt(), character.toInt());
}

auto Position::toJson() const -> QJsonObject
{
  return {{lineKey, line}, {characterKey, character}};
}

auto Range::fromJson(const QJsonValue &value) -> std::optional<Range>
{
  const auto object = value.toObject();
  const auto start = Position::fromJson(object.value(startKey));
  const auto end = Position::fromJson(object.value(endKey));
  if (!start || !end)
    return std::nullopt;
  return Range(*start, *end);
}

auto Range::toJson() const -> QJsonObject
{
  return {{startKey, start.toJson()}, {endKey, end.toJson()}};
}

auto Location::fromJson(const QJsonValue &value) -> std::optional<Location>
{
  const auto object = value.toObject();
  if (object.contains(targetUriKey)) {
    auto range = Range::fromJson(object.value(targetSelectionRangeKey));
    if (!range)
      range = Range::fromJson(object.value(targetRangeKey));
    if (!range)
      return std::nullopt;
    return Location(object.value(targetUriKey).toString(), *range);
  }
  const auto uri = object.value(uriKey);
  const auto range = Range::fromJson(object.value(rangeKey));
  if (!uri.isString() || !range)
    return std::nullopt;
  return Location(uri.toString(), *range);
}

auto Location::toJson() const -> QJsonObject
{
  return {{uriKey, uri}, {rangeKey, range.toJson()}};
}

auto TextEdit::fromJson(const QJsonValue &value) -> std::optional<TextEdit>
{
  const auto object = value.toObject();
  const auto range = Range::fromJson(object.value(rangeKey));
  if (!range || !object.value(newTextKey).isString())
    return std::nullopt;
  return TextEdit{*range, object.value(newTextKey).toString()};
}

auto TextEdit::toJson() const -> QJsonObject
{
  return {{rangeKey, range.toJson()}, {newTextKey, newText}};
}

auto TextDocumentItem::toJson() const -> QJsonObject
{
  return {{uriKey, uri}, {languageIdKey, languageId}, {versionKey, version}, {textKey, text}};
}

auto languageIdForFile(const QString &filePath) -> QString
{
  static const QHash<QString, QString> languageIds = {
    {"py", "python"}, {"pyi", "python"},
    {"c", "c"}, {"h", "c"},
    {"cc", "cpp"}, {"cpp", "cpp"}, {"cxx", "cpp"}, {"hh", "cpp"}, {"hpp", "cpp"}, {"hxx", "cpp"},
    {"rs", "rust"}, {"go", "go"}, {"java", "java"},
    {"js", "javascript"}, {"mjs", "javascript"}, {"jsx", "javascriptreact"},
    {"ts", "typescript"}, {"tsx", "typescriptreact"},
    {"json", "json"}, {"lua", "lua"}, {"rb", "ruby"}, {"sh", "shellscript"},
    {"cs", "csharp"}, {"kt", "kotlin"}, {"swift", "swift"}, {"zig", "zig"},
    {"md", "markdown"}, {"yaml", "yaml"}, {"yml", "yaml"}, {"toml", "toml"},
  };
  return languageIds.value(QFileInfo(filePath).suffix().toLower());
}

auto textDocumentIdentifier(const QString &uri) -> QJsonObject
{
  return {{uriKey, uri}};
}

} // namespace LspMux::LanguageServerProtocol
