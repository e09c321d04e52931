// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageclient_global.hpp"

#include "lsperror.hpp"

#include <languageserverprotocol/jsonrpcmessages.hpp>

#include <QFuture>
#include <QFutureInterface>
#include <QHash>
#include <QMutex>
#include <QSet>

#include <optional>

QT_BEGIN_NAMESPACE
class QObject;
QT_END_NAMESPACE

namespace LspMux::LanguageClient {

// Matches responses to outstanding requests of one connection. Every registered request is
// resolved exactly once: by its response, a timeout, a local cancellation or a failure of the
// connection. All functions are thread-safe.
class LSPMUX_CLIENT_EXPORT RequestCorrelator {
public:
  explicit RequestCorrelator(const QString &backendId = {});
  ~RequestCorrelator();
  RequestCorrelator(const RequestCorrelator &) = delete;
  RequestCorrelator(RequestCorrelator &&) = delete;

  auto operator=(const RequestCorrelator &) -> RequestCorrelator& = delete;
  auto operator=(RequestCorrelator &&) -> RequestCorrelator& = delete;

  auto nextId() -> LanguageServerProtocol::MessageId;
  // Returns nothing if the id is pending or was used before on this connection.
  auto registerRequest(const LanguageServerProtocol::MessageId &id, const QString &method) -> std::optional<QFuture<Reply>>;

  // Returns false if nobody waits for the id (unknown, already resolved, timed out or cancelled).
  auto resolve(const LanguageServerProtocol::MessageId &id, const Reply &reply) -> bool;
  auto resolveResponse(const LanguageServerProtocol::JsonRpcMessage &response) -> bool;
  auto expire(const LanguageServerProtocol::MessageId &id) -> bool;
  auto cancel(const LanguageServerProtocol::MessageId &id) -> bool;
  auto failAll(const LspError &error) -> void;

  // Expires the request after msecs, measured by a timer in the thread of context.
  auto timeoutAfter(const LanguageServerProtocol::MessageId &id, int msecs, QObject *context) -> void;

  auto isPending(const LanguageServerProtocol::MessageId &id) const -> bool;
  auto pendingCount() const -> int;
  auto methodFor(const LanguageServerProtocol::MessageId &id) const -> QString;

private:
  struct PendingRequest {
    QString method;
    QFutureInterface<Reply> futureInterface;
  };

  auto take(const LanguageServerProtocol::MessageId &id, PendingRequest *request) -> bool;
  auto isUsed(const LanguageServerProtocol::MessageId &id) const -> bool;

  const QString m_backendId;
  mutable QMutex m_mutex;
  int m_nextId = 1;
  QSet<int> m_reservedIds;
  QSet<QString> m_usedStringIds;
  QHash<LanguageServerProtocol::MessageId, PendingRequest> m_pending;
};

} // namespace LspMux::LanguageClient
