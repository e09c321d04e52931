// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "lsperror.hpp"

#include <QFutureInterface>

using namespace LspMux::LanguageServerProtocol;

namespace LspMux::LanguageClient {

LspError::LspError(Kind kind, const QString &message, const QString &backendId, const QString &method) : kind(kind), backendId(backendId), method(method), message(message) {}

auto LspError::fromResponseError(const ResponseError &error) -> LspError
{
  LspError result(BackendProtocolError, error.message);
  result.code = error.code;
  result.data = error.data;
  return result;
}

auto LspError::kindName(Kind kind) -> QString
{
  switch (kind) {
  case FramingError:
    return QString("FramingError");
  case BackendStartError:
    return QString("BackendStartError");
  case BackendNotReady:
    return QString("BackendNotReady");
  case BackendTimeout:
    return QString("BackendTimeout");
  case BackendProtocolError:
    return QString("BackendProtocolError");
  case BackendTerminated:
    return QString("BackendTerminated");
  case UnknownBackend:
    return QString("UnknownBackend");
  case NoBackendForFile:
    return QString("NoBackendForFile");
  case CapabilityUnsupported:
    return QString("CapabilityUnsupported");
  case Cancelled:
    return QString("Cancelled");
  case MalformedResponse:
    return QString("MalformedResponse");
  case DocumentError:
    return QString("DocumentError");
  case MethodDisabled:
    return QString("MethodDisabled");
  case ShutdownError:
    return QString("ShutdownError");
  }
  return QString();
}

auto LspError::withContext(const QString &backendId, const QString &method) const -> LspError
{
  auto result = *this;
  if (result.backendId.isEmpty())
    result.backendId = backendId;
  if (result.method.isEmpty())
    result.method = method;
  return result;
}

auto LspError::toString() const -> QString
{
  auto result = kindName(kind);
  if (!backendId.isEmpty())
    result += tr(" [%1]").arg(backendId);
  if (!method.isEmpty())
    result += tr(" %1").arg(method);
  if (code)
    result += tr(" (code %1)").arg(*code);
  if (!message.isEmpty())
    result += tr(": %1").arg(message);
  return result;
}

auto Reply::fromResult(const QJsonValue &result) -> Reply
{
  Reply reply;
  reply.m_result = result;
  return reply;
}

auto Reply::fromError(const LspError &error) -> Reply
{
  Reply reply;
  reply.m_error = error;
  return reply;
}

auto readyReply(const Reply &reply) -> QFuture<Reply>
{
  QFutureInterface<Reply> futureInterface;
  futureInterface.reportStarted();
  futureInterface.reportResult(reply);
  futureInterface.reportFinished();
  return futureInterface.future();
}

} // namespace LspMux::LanguageClient
