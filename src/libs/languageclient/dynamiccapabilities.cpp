// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "dynamiccapabilities.hpp"

#include <languageserverprotocol/servercapabilities.hpp>

#include <QJsonObject>

using namespace LspMux::LanguageServerProtocol;

namespace LspMux::LanguageClient {

constexpr char idKey[] = "id";
constexpr char methodKey[] = "method";
constexpr char registerOptionsKey[] = "registerOptions";

auto DynamicCapabilities::registerCapability(const QJsonArray &registrations) -> void
{
  for (const auto &value : registrations) {
    const auto registration = value.toObject();
    const auto method = registration.value(methodKey).toString();
    const auto id = registration.value(idKey).toString();
    if (method.isEmpty())
      continue;
    m_capability[method].enable(id, registration.value(registerOptionsKey));
    m_methodForId.insert(id, method);
  }
}

auto DynamicCapabilities::unregisterCapability(const QJsonArray &unregistrations) -> void
{
  for (const auto &value : unregistrations) {
    const auto unregistration = value.toObject();
    const auto id = unregistration.value(idKey).toString();
    auto method = unregistration.value(methodKey).toString();
    if (method.isEmpty())
      method = m_methodForId.value(id);
    if (method.isEmpty())
      continue;
    m_capability[method].disable();
    m_methodForId.remove(id);
  }
}

auto DynamicCapabilities::isRegistered(const QString &method) const -> std::optional<bool>
{
  if (!m_capability.contains(method))
    return std::nullopt;
  return m_capability[method].enabled();
}

auto DynamicCapabilities::isCapabilityRegistered(const QString &capabilityPath) const -> bool
{
  for (auto it = m_capability.cbegin(); it != m_capability.cend(); ++it) {
    if (it.value().enabled() && ServerCapabilities::capabilityForMethod(it.key()) == capabilityPath)
      return true;
  }
  return false;
}

auto DynamicCapabilities::registeredMethods() const -> QStringList
{
  return m_capability.keys();
}

auto DynamicCapabilities::reset() -> void
{
  m_capability.clear();
  m_methodForId.clear();
}

} // namespace LspMux::LanguageClient
