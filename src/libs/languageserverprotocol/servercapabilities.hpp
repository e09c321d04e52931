// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageserverprotocol_global.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>

namespace LspMux::LanguageServerProtocol {

// The capabilities a server declared in its initialize result. Keys are looked up by dotted path,
// e.g. "completionProvider.resolveProvider".
class LSPMUX_PROTOCOL_EXPORT ServerCapabilities {
public:
  ServerCapabilities() = default;
  explicit ServerCapabilities(const QJsonObject &capabilities) : m_capabilities(capabilities) {}

  // Undefined if any path segment is missing.
  auto value(const QString &path) const -> QJsonValue;
  // A capability is present unless it is missing, null or false.
  auto has(const QString &path) const -> bool;
  // False only if the server explicitly declared textDocumentSync.openClose = false.
  auto sendsOpenClose() const -> bool;
  auto isEmpty() const -> bool { return m_capabilities.isEmpty(); }
  auto toJson() const -> QJsonObject { return m_capabilities; }

  // The capability path a request method depends on, empty if it needs none.
  static auto capabilityForMethod(const QString &method) -> QString;
  static auto isPresent(const QJsonValue &value) -> bool;

private:
  QJsonObject m_capabilities;
};

} // namespace LspMux::LanguageServerProtocol
