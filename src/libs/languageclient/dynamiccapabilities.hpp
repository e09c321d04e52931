// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageclient_global.hpp"

#include <QHash>
#include <QJsonArray>
#include <QJsonValue>
#include <QStringList>

#include <optional>

namespace LspMux::LanguageClient {

class DynamicCapability {
public:
  DynamicCapability() = default;

  auto enable(const QString &id, const QJsonValue &options) -> void
  {
    m_enabled = true;
    m_id = id;
    m_options = options;
  }

  auto disable() -> void
  {
    m_enabled = false;
    m_id.clear();
    m_options = QJsonValue();
  }

  auto enabled() const -> bool { return m_enabled; }
  auto options() const -> QJsonValue { return m_options; }

private:
  bool m_enabled = false;
  QString m_id;
  QJsonValue m_options;
};

// Capabilities registered by the server at runtime through client/registerCapability.
class LSPMUX_CLIENT_EXPORT DynamicCapabilities {
public:
  DynamicCapabilities() = default;

  // Entries of RegistrationParams.registrations: {id, method, registerOptions}.
  auto registerCapability(const QJsonArray &registrations) -> void;
  // Entries of UnregistrationParams.unregisterations: {id, method}.
  auto unregisterCapability(const QJsonArray &unregistrations) -> void;
  auto isRegistered(const QString &method) const -> std::optional<bool>;
  // Whether a method depending on the capability path is registered.
  auto isCapabilityRegistered(const QString &capabilityPath) const -> bool;
  auto option(const QString &method) const -> QJsonValue { return m_capability.value(method).options(); }
  auto registeredMethods() const -> QStringList;
  auto reset() -> void;

private:
  QHash<QString, DynamicCapability> m_capability;
  QHash<QString, QString> m_methodForId;
};

} // namespace LspMux::LanguageClient
