// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "languagefeatures.hpp"

#include <QJsonArray>
#include <QJsonObject>

namespace LspMux::LanguageServerProtocol {

constexpr char contentsKey[] = "contents";
constexpr char kindKey[] = "kind";
constexpr char valueKey[] = "value";
constexpr char languageKey[] = "language";
constexpr char rangeKey[] = "range";
constexpr char nameKey[] = "name";
constexpr char containerNameKey[] = "containerName";
constexpr char locationKey[] = "location";
constexpr char uriKey[] = "uri";
constexpr char detailKey[] = "detail";
constexpr char selectionRangeKey[] = "selectionRange";
constexpr char childrenKey[] = "children";
constexpr char labelKey[] = "label";
constexpr char documentationKey[] = "documentation";
constexpr char insertTextKey[] = "insertText";
constexpr char sortTextKey[] = "sortText";
constexpr char filterTextKey[] = "filterText";
constexpr char isIncompleteKey[] = "isIncomplete";
constexpr char itemsKey[] = "items";
constexpr char changesKey[] = "changes";
constexpr char documentChangesKey[] = "documentChanges";
constexpr char textDocumentKey[] = "textDocument";
constexpr char editsKey[] = "edits";

static auto markupContent(const QJsonValue &value) -> std::optional<MarkupContent>
{
  // MarkedString as plain string, MarkedString as code block, or MarkupContent
  if (value.isString())
    return MarkupContent{"markdown", {}, value.toString()};
  if (!value.isObject())
    return std::nullopt;
  const auto object = value.toObject();
  if (!object.value(valueKey).isString())
    return std::nullopt;
  if (object.contains(languageKey))
    return MarkupContent{"markdown", object.value(languageKey).toString(), object.value(valueKey).toString()};
  return MarkupContent{object.value(kindKey).toString("plaintext"), {}, object.value(valueKey).toString()};
}

// Documentation fields are either a string or a MarkupContent.
static auto documentationText(const QJsonValue &value) -> QString
{
  if (value.isString())
    return value.toString();
  return value.toObject().value(valueKey).toString();
}

auto ResultDecoder::decodeHover(const QJsonValue &result) -> std::optional<Hover>
{
  if (!result.isObject())
    return std::nullopt;
  const auto object = result.toObject();
  Hover hover;
  const auto contents = object.value(contentsKey);
  if (contents.isArray()) {
    for (const auto &entry : contents.toArray()) {
      const auto content = markupContent(entry);
      if (!content)
        return std::nullopt;
      hover.contents.append(*content);
    }
  } else {
    const auto content = markupContent(contents);
    if (!content)
      return std::nullopt;
    hover.contents.append(*content);
  }
  if (object.contains(rangeKey)) {
    hover.range = Range::fromJson(object.value(rangeKey));
    if (!hover.range)
      return std::nullopt;
  }
  return hover;
}

auto ResultDecoder::decodeLocations(const QJsonValue &result) -> std::optional<QList<Location>>
{
  QList<Location> locations;
  if (result.isObject()) {
    const auto location = Location::fromJson(result);
    if (!location)
      return std::nullopt;
    locations.append(*location);
    return locations;
  }
  if (!result.isArray())
    return std::nullopt;
  for (const auto &entry : result.toArray()) {
    const auto location = Location::fromJson(entry);
    if (!location)
      return std::nullopt;
    locations.append(*location);
  }
  return locations;
}

static auto symbolInformation(const QJsonValue &value) -> std::optional<SymbolInformation>
{
  const auto object = value.toObject();
  if (!object.value(nameKey).isString())
    return std::nullopt;
  SymbolInformation symbol;
  symbol.name = object.value(nameKey).toString();
  symbol.kind = object.value(kindKey).toInt();
  symbol.containerName = object.value(containerNameKey).toString();
  const auto locationValue = object.value(locationKey);
  if (const auto location = Location::fromJson(locationValue)) {
    symbol.location = *location;
  } else if (locationValue.toObject().value(uriKey).isString()) {
    // workspace symbols may omit the range until resolved
    symbol.location.uri = locationValue.toObject().value(uriKey).toString();
  } else {
    return std::nullopt;
  }
  return symbol;
}

auto ResultDecoder::decodeSymbolInformation(const QJsonValue &result) -> std::optional<QList<SymbolInformation>>
{
  if (!result.isArray())
    return std::nullopt;
  QList<SymbolInformation> symbols;
  for (const auto &entry : result.toArray()) {
    const auto symbol = symbolInformation(entry);
    if (!symbol)
      return std::nullopt;
    symbols.append(*symbol);
  }
  return symbols;
}

static auto documentSymbol(const QJsonValue &value) -> std::optional<DocumentSymbol>
{
  const auto object = value.toObject();
  const auto range = Range::fromJson(object.value(rangeKey));
  const auto selectionRange = Range::fromJson(object.value(selectionRangeKey));
  if (!object.value(nameKey).isString() || !range || !selectionRange)
    return std::nullopt;
  DocumentSymbol symbol;
  symbol.name = object.value(nameKey).toString();
  symbol.detail = object.value(detailKey).toString();
  symbol.kind = object.value(kindKey).toInt();
  symbol.range = *range;
  symbol.selectionRange = *selectionRange;
  for (const auto &child : object.value(childrenKey).toArray()) {
    const auto childSymbol = documentSymbol(child);
    if (!childSymbol)
      return std::nullopt;
    symbol.children.append(*childSymbol);
  }
  return symbol;
}

auto ResultDecoder::decodeDocumentSymbols(const QJsonValue &result) -> std::optional<QList<DocumentSymbol>>
{
  if (!result.isArray())
    return std::nullopt;
  QList<DocumentSymbol> symbols;
  for (const auto &entry : result.toArray()) {
    const auto symbol = documentSymbol(entry);
    if (!symbol)
      return std::nullopt;
    symbols.append(*symbol);
  }
  return symbols;
}

static auto completionItem(const QJsonValue &value) -> std::optional<CompletionItem>
{
  const auto object = value.toObject();
  if (!object.value(labelKey).isString())
    return std::nullopt;
  CompletionItem item;
  item.label = object.value(labelKey).toString();
  if (object.value(kindKey).isDouble())
    item.kind = object.value(kindKey).toInt();
  item.detail = object.value(detailKey).toString();
  item.documentation = documentationText(object.value(documentationKey));
  item.insertText = object.value(insertTextKey).toString();
  item.sortText = object.value(sortTextKey).toString();
  item.filterText = object.value(filterTextKey).toString();
  return item;
}

auto ResultDecoder::decodeCompletion(const QJsonValue &result) -> std::optional<CompletionList>
{
  CompletionList list;
  QJsonArray items;
  if (result.isArray()) {
    items = result.toArray();
  } else if (result.isObject()) {
    const auto object = result.toObject();
    list.isIncomplete = object.value(isIncompleteKey).toBool();
    if (!object.value(itemsKey).isArray())
      return std::nullopt;
    items = object.value(itemsKey).toArray();
  } else {
    return std::nullopt;
  }
  for (const auto &entry : items) {
    const auto item = completionItem(entry);
    if (!item)
      return std::nullopt;
    list.items.append(*item);
  }
  return list;
}

static auto textEdits(const QJsonValue &value) -> std::optional<QList<TextEdit>>
{
  if (!value.isArray())
    return std::nullopt;
  QList<TextEdit> edits;
  for (const auto &entry : value.toArray()) {
    const auto edit = TextEdit::fromJson(entry);
    if (!edit)
      return std::nullopt;
    edits.append(*edit);
  }
  return edits;
}

auto ResultDecoder::decodeWorkspaceEdit(const QJsonValue &result) -> std::optional<WorkspaceEdit>
{
  if (!result.isObject())
    return std::nullopt;
  const auto object = result.toObject();
  WorkspaceEdit edit;
  const auto changes = object.value(changesKey).toObject();
  for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
    const auto edits = textEdits(it.value());
    if (!edits)
      return std::nullopt;
    edit.changes[it.key()].append(*edits);
  }
  for (const auto &entry : object.value(documentChangesKey).toArray()) {
    const auto documentChange = entry.toObject();
    // create, rename and delete file operations carry a "kind" and no edits
    if (!documentChange.contains(textDocumentKey))
      continue;
    const auto edits = textEdits(documentChange.value(editsKey));
    if (!edits)
      return std::nullopt;
    edit.changes[documentChange.value(textDocumentKey).toObject().value(uriKey).toString()].append(*edits);
  }
  return edit;
}

template <typename T>
static auto wrap(const std::optional<T> &decoded) -> std::optional<LspResult>
{
  if (!decoded)
    return std::nullopt;
  return LspResult(*decoded);
}

auto ResultDecoder::decode(const QString &method, const QJsonValue &result, QString *errorMessage) -> std::optional<LspResult>
{
  if (result.isNull() || result.isUndefined())
    return LspResult(nullptr);

  std::optional<LspResult> decoded;
  if (method == Methods::hover) {
    decoded = wrap(decodeHover(result));
  } else if (method == Methods::definition || method == Methods::declaration || method == Methods::typeDefinition
             || method == Methods::implementation || method == Methods::references) {
    decoded = wrap(decodeLocations(result));
  } else if (method == Methods::documentSymbol) {
    // either a flat SymbolInformation list or a DocumentSymbol hierarchy
    const auto first = result.toArray().at(0).toObject();
    if (first.contains(locationKey))
      decoded = wrap(decodeSymbolInformation(result));
    else
      decoded = wrap(decodeDocumentSymbols(result));
  } else if (method == Methods::workspaceSymbol) {
    decoded = wrap(decodeSymbolInformation(result));
  } else if (method == Methods::completion) {
    decoded = wrap(decodeCompletion(result));
  } else if (method == Methods::rename) {
    decoded = wrap(decodeWorkspaceEdit(result));
  } else {
    return LspResult(result);
  }

  if (!decoded && errorMessage)
    *errorMessage = tr("Unexpected result shape for \"%1\".").arg(method);
  return decoded;
}

} // namespace LspMux::LanguageServerProtocol
