// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "languageserverprotocol_global.hpp"

#include "basemessage.hpp"

#include <QCoreApplication>
#include <QHash>
#include <QJsonObject>
#include <QJsonValue>
#include <QString>

#include <optional>
#include <variant>

namespace LspMux::LanguageServerProtocol {

#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
using QHashSeedType = size_t;
#else
using QHashSeedType = uint;
#endif

constexpr char jsonRpcVersion[] = "2.0";
constexpr char jsonRpcVersionKey[] = "jsonrpc";
constexpr char idKey[] = "id";
constexpr char methodKey[] = "method";
constexpr char paramsKey[] = "params";
constexpr char resultKey[] = "result";
constexpr char errorKey[] = "error";
constexpr char codeKey[] = "code";
constexpr char messageKey[] = "message";
constexpr char dataKey[] = "data";

class LSPMUX_PROTOCOL_EXPORT MessageId : public std::variant<int, QString> {
public:
  MessageId() : variant(QString()) {}
  explicit MessageId(int id) : variant(id) {}
  explicit MessageId(const QString &id) : variant(id) {}
  explicit MessageId(const QJsonValue &value);

  auto toJson() const -> QJsonValue;
  auto isValid() const -> bool;
  auto toString() const -> QString;
};

inline auto qHash(const MessageId &id, QHashSeedType seed = 0) -> QHashSeedType
{
  if (const auto intId = std::get_if<int>(&id))
    return ::qHash(*intId, seed);
  return ::qHash(std::get<QString>(id), seed);
}

class LSPMUX_PROTOCOL_EXPORT ResponseError {
  Q_DECLARE_TR_FUNCTIONS(ResponseError)

public:
  enum ErrorCodes {
    // Defined by JSON RPC
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerNotInitialized = -32002,
    UnknownErrorCode = -32001,
    // Defined by the protocol.
    RequestFailed = -32803,
    ServerCancelled = -32802,
    ContentModified = -32801,
    RequestCancelled = -32800
  };

  ResponseError() = default;
  ResponseError(int code, const QString &message, const QJsonValue &data = {});

  static auto fromJson(const QJsonValue &value) -> std::optional<ResponseError>;
  auto toJson() const -> QJsonObject;
  auto toString() const -> QString;

  int code = UnknownErrorCode;
  QString message;
  QJsonValue data;
};

// A decoded JSON-RPC 2.0 message. The kind is derived from the members present: a method with an
// id is a request, a method without id a notification, an id without method a response.
class LSPMUX_PROTOCOL_EXPORT JsonRpcMessage {
  Q_DECLARE_TR_FUNCTIONS(JsonRpcMessage)

public:
  enum Kind {
    Invalid,
    Request,
    Notification,
    Response
  };

  JsonRpcMessage() = default;
  explicit JsonRpcMessage(const QJsonObject &object);

  static auto fromBaseMessage(const BaseMessage &message, QString *parseError) -> JsonRpcMessage;
  static auto request(const MessageId &id, const QString &method, const QJsonValue &params = QJsonValue(QJsonValue::Undefined)) -> JsonRpcMessage;
  static auto notification(const QString &method, const QJsonValue &params = QJsonValue(QJsonValue::Undefined)) -> JsonRpcMessage;
  static auto response(const MessageId &id, const QJsonValue &result) -> JsonRpcMessage;
  static auto errorResponse(const MessageId &id, const ResponseError &error) -> JsonRpcMessage;

  auto kind() const -> Kind;
  auto isValid() const -> bool { return kind() != Invalid; }
  auto id() const -> MessageId;
  auto method() const -> QString;
  auto params() const -> QJsonValue;
  auto result() const -> QJsonValue;
  auto error() const -> std::optional<ResponseError>;

  auto toJson() const -> QJsonObject { return m_jsonObject; }
  auto toBaseMessage() const -> BaseMessage;

private:
  QJsonObject m_jsonObject;
};

} // namespace LspMux::LanguageServerProtocol
