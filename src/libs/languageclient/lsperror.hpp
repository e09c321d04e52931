// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageclient_global.hpp"

#include <languageserverprotocol/jsonrpcmessages.hpp>

#include <QCoreApplication>
#include <QFuture>
#include <QJsonValue>
#include <QString>

#include <optional>

namespace LspMux::LanguageClient {

class LSPMUX_CLIENT_EXPORT LspError {
  Q_DECLARE_TR_FUNCTIONS(LspError)

public:
  enum Kind {
    FramingError,
    BackendStartError,
    BackendNotReady,
    BackendTimeout,
    BackendProtocolError,
    BackendTerminated,
    UnknownBackend,
    NoBackendForFile,
    CapabilityUnsupported,
    Cancelled,
    MalformedResponse,
    DocumentError,
    MethodDisabled,
    ShutdownError
  };

  LspError() = default;
  LspError(Kind kind, const QString &message, const QString &backendId = {}, const QString &method = {});

  static auto fromResponseError(const LanguageServerProtocol::ResponseError &error) -> LspError;
  static auto kindName(Kind kind) -> QString;

  // Fills backend id and method where they are still unknown.
  auto withContext(const QString &backendId, const QString &method) const -> LspError;
  auto toString() const -> QString;

  Kind kind = BackendProtocolError;
  QString backendId;
  QString method;
  QString message;
  std::optional<int> code;
  QJsonValue data;
};

// The single resolution of a request: a result or an error.
class LSPMUX_CLIENT_EXPORT Reply {
public:
  Reply() = default;

  static auto fromResult(const QJsonValue &result) -> Reply;
  static auto fromError(const LspError &error) -> Reply;

  auto isError() const -> bool { return m_error.has_value(); }
  auto result() const -> QJsonValue { return m_result; }
  auto error() const -> const std::optional<LspError>& { return m_error; }

private:
  QJsonValue m_result;
  std::optional<LspError> m_error;
};

// A future that is already resolved with the given reply.
LSPMUX_CLIENT_EXPORT auto readyReply(const Reply &reply) -> QFuture<Reply>;

} // namespace LspMux::LanguageClient
