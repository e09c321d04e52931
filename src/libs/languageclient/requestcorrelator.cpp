// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "requestcorrelator.hpp"

#include <utils/lspmuxassert.hpp>

#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>

using namespace LspMux::LanguageServerProtocol;

static Q_LOGGING_CATEGORY(LOGLSPCORRELATOR, "lspmux.languageclient.correlator", QtWarningMsg);

namespace LspMux::LanguageClient {

RequestCorrelator::RequestCorrelator(const QString &backendId) : m_backendId(backendId) {}

RequestCorrelator::~RequestCorrelator()
{
  failAll(LspError(LspError::BackendTerminated, LspError::tr("The connection was destroyed.")));
}

auto RequestCorrelator::nextId() -> MessageId
{
  QMutexLocker locker(&m_mutex);
  const auto id = m_nextId++;
  m_reservedIds.insert(id);
  return MessageId(id);
}

// Integer ids are unique when they come from nextId() or lie above every id handed out so far.
auto RequestCorrelator::isUsed(const MessageId &id) const -> bool
{
  if (const auto intId = std::get_if<int>(&id))
    return !m_reservedIds.contains(*intId) && *intId < m_nextId;
  return m_usedStringIds.contains(std::get<QString>(id));
}

auto RequestCorrelator::registerRequest(const MessageId &id, const QString &method) -> std::optional<QFuture<Reply>>
{
  LSPMUX_ASSERT(id.isValid(), return std::nullopt);
  QMutexLocker locker(&m_mutex);
  if (m_pending.contains(id) || isUsed(id)) {
    qCWarning(LOGLSPCORRELATOR) << "rejecting reused request id" << id.toString() << "for" << method;
    return std::nullopt;
  }
  if (const auto intId = std::get_if<int>(&id)) {
    m_reservedIds.remove(*intId);
    if (*intId >= m_nextId)
      m_nextId = *intId + 1;
  } else {
    m_usedStringIds.insert(std::get<QString>(id));
  }

  PendingRequest request;
  request.method = method;
  request.futureInterface.reportStarted();
  const auto future = request.futureInterface.future();
  m_pending.insert(id, request);
  return future;
}

auto RequestCorrelator::take(const MessageId &id, PendingRequest *request) -> bool
{
  QMutexLocker locker(&m_mutex);
  const auto it = m_pending.find(id);
  if (it == m_pending.end())
    return false;
  *request = it.value();
  m_pending.erase(it);
  return true;
}

auto RequestCorrelator::resolve(const MessageId &id, const Reply &reply) -> bool
{
  PendingRequest request;
  if (!take(id, &request)) {
    qCDebug(LOGLSPCORRELATOR) << "dropping reply for unknown or expired id" << id.toString();
    return false;
  }
  // the future is completed outside the lock, continuations may call back into the correlator
  auto resolved = reply;
  if (reply.isError())
    resolved = Reply::fromError(reply.error()->withContext(m_backendId, request.method));
  request.futureInterface.reportResult(resolved);
  request.futureInterface.reportFinished();
  return true;
}

auto RequestCorrelator::resolveResponse(const JsonRpcMessage &response) -> bool
{
  LSPMUX_ASSERT(response.kind() == JsonRpcMessage::Response, return false);
  if (const auto error = response.error())
    return resolve(response.id(), Reply::fromError(LspError::fromResponseError(*error)));
  return resolve(response.id(), Reply::fromResult(response.result()));
}

auto RequestCorrelator::expire(const MessageId &id) -> bool
{
  // timers outlive the requests they guard
  if (!isPending(id))
    return false;
  const auto method = methodFor(id);
  const auto resolved = resolve(id, Reply::fromError(LspError(LspError::BackendTimeout, LspError::tr("Request %1 timed out.").arg(id.toString()))));
  if (resolved)
    qCWarning(LOGLSPCORRELATOR) << "request" << id.toString() << method << "timed out";
  return resolved;
}

auto RequestCorrelator::cancel(const MessageId &id) -> bool
{
  return resolve(id, Reply::fromError(LspError(LspError::Cancelled, LspError::tr("Request %1 was cancelled.").arg(id.toString()))));
}

auto RequestCorrelator::failAll(const LspError &error) -> void
{
  QHash<MessageId, PendingRequest> pending;
  {
    QMutexLocker locker(&m_mutex);
    pending.swap(m_pending);
  }
  if (!pending.isEmpty())
    qCDebug(LOGLSPCORRELATOR) << "failing" << pending.size() << "pending requests:" << error.toString();
  for (auto it = pending.begin(); it != pending.end(); ++it) {
    it->futureInterface.reportResult(Reply::fromError(error.withContext(m_backendId, it->method)));
    it->futureInterface.reportFinished();
  }
}

auto RequestCorrelator::timeoutAfter(const MessageId &id, int msecs, QObject *context) -> void
{
  LSPMUX_ASSERT(context, return);
  if (msecs < 0)
    return;
  // The timer has to be created in the thread of its context object. The context is owned by the
  // connection, which is destroyed before its correlator.
  QMetaObject::invokeMethod(context, [this, id, msecs, context] {
    QTimer::singleShot(msecs, context, [this, id] { expire(id); });
  }, Qt::QueuedConnection);
}

auto RequestCorrelator::isPending(const MessageId &id) const -> bool
{
  QMutexLocker locker(&m_mutex);
  return m_pending.contains(id);
}

auto RequestCorrelator::pendingCount() const -> int
{
  QMutexLocker locker(&m_mutex);
  return m_pending.size();
}

auto RequestCorrelator::methodFor(const MessageId &id) const -> QString
{
  QMutexLocker locker(&m_mutex);
  return m_pending.value(id).method;
}

} // namespace LspMux::LanguageClient
