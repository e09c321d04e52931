// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "jsonrpcmessages.hpp"

#include <QJsonDocument>

#include <cmath>

namespace LspMux::LanguageServerProtocol {

MessageId::MessageId(const QJsonValue &value) : variant(QString())
{
  if (value.isDouble()) {
    const auto number = value.toDouble();
    if (std::floor(number) == number)
      emplace<int>(value.toInt());
  } else if (value.isString()) {
    emplace<QString>(value.toString());
  }
}

auto MessageId::toJson() const -> QJsonValue
{
  if (const auto intId = std::get_if<int>(this))
    return *intId;
  const auto &stringId = std::get<QString>(*this);
  return stringId.isEmpty() ? QJsonValue() : QJsonValue(stringId);
}

auto MessageId::isValid() const -> bool
{
  return std::holds_alternative<int>(*this) || !std::get<QString>(*this).isEmpty();
}

auto MessageId::toString() const -> QString
{
  if (const auto intId = std::get_if<int>(this))
    return QString::number(*intId);
  return std::get<QString>(*this);
}

ResponseError::ResponseError(int code, const QString &message, const QJsonValue &data) : code(code), message(message), data(data) {}

auto ResponseError::fromJson(const QJsonValue &value) -> std::optional<ResponseError>
{
  if (!value.isObject())
    return std::nullopt;
  const auto object = value.toObject();
  const auto code = object.value(codeKey);
  if (!code.isDouble())
    return std::nullopt;
  return ResponseError(code.toInt(), object.value(messageKey).toString(), object.value(dataKey));
}

auto ResponseError::toJson() const -> QJsonObject
{
  QJsonObject object{{codeKey, code}, {messageKey, message}};
  if (!data.isUndefined() && !data.isNull())
    object.insert(dataKey, data);
  return object;
}

auto ResponseError::toString() const -> QString
{
  return tr("Error %1: %2").arg(code).arg(message);
}

JsonRpcMessage::JsonRpcMessage(const QJsonObject &object) : m_jsonObject(object) {}

auto JsonRpcMessage::fromBaseMessage(const BaseMessage &message, QString *parseError) -> JsonRpcMessage
{
  QJsonParseError error;
  const auto document = QJsonDocument::fromJson(message.content, &error);
  if (error.error != QJsonParseError::NoError) {
    if (parseError)
      *parseError = tr("Could not parse JSON message: \"%1\".").arg(error.errorString());
    return {};
  }
  if (!document.isObject()) {
    if (parseError)
      *parseError = tr("Expected a JSON object, but got: %1.").arg(QString::fromUtf8(message.content.left(80)));
    return {};
  }
  JsonRpcMessage result(document.object());
  if (!result.isValid() && parseError)
    *parseError = tr("The JSON object is not a JSON-RPC request, notification or response.");
  return result;
}

static auto baseObject() -> QJsonObject
{
  return QJsonObject{{jsonRpcVersionKey, jsonRpcVersion}};
}

auto JsonRpcMessage::request(const MessageId &id, const QString &method, const QJsonValue &params) -> JsonRpcMessage
{
  auto object = baseObject();
  object.insert(idKey, id.toJson());
  object.insert(methodKey, method);
  if (!params.isUndefined())
    object.insert(paramsKey, params);
  return JsonRpcMessage(object);
}

auto JsonRpcMessage::notification(const QString &method, const QJsonValue &params) -> JsonRpcMessage
{
  auto object = baseObject();
  object.insert(methodKey, method);
  if (!params.isUndefined())
    object.insert(paramsKey, params);
  return JsonRpcMessage(object);
}

auto JsonRpcMessage::response(const MessageId &id, const QJsonValue &result) -> JsonRpcMessage
{
  auto object = baseObject();
  object.insert(idKey, id.toJson());
  // a response always carries a result, a null result included
  object.insert(resultKey, result.isUndefined() ? QJsonValue() : result);
  return JsonRpcMessage(object);
}

auto JsonRpcMessage::errorResponse(const MessageId &id, const ResponseError &error) -> JsonRpcMessage
{
  auto object = baseObject();
  object.insert(idKey, id.toJson());
  object.insert(errorKey, error.toJson());
  return JsonRpcMessage(object);
}

auto JsonRpcMessage::kind() const -> Kind
{
  const auto method = m_jsonObject.value(methodKey);
  if (method.isString())
    return m_jsonObject.contains(idKey) ? Request : Notification;
  if (m_jsonObject.contains(idKey))
    return Response;
  return Invalid;
}

auto JsonRpcMessage::id() const -> MessageId
{
  return MessageId(m_jsonObject.value(idKey));
}

auto JsonRpcMessage::method() const -> QString
{
  return m_jsonObject.value(methodKey).toString();
}

auto JsonRpcMessage::params() const -> QJsonValue
{
  return m_jsonObject.value(paramsKey);
}

auto JsonRpcMessage::result() const -> QJsonValue
{
  return m_jsonObject.value(resultKey);
}

auto JsonRpcMessage::error() const -> std::optional<ResponseError>
{
  const auto error = m_jsonObject.value(errorKey);
  if (error.isUndefined() || error.isNull())
    return std::nullopt;
  if (auto responseError = ResponseError::fromJson(error))
    return responseError;
  return ResponseError(ResponseError::InternalError, tr("Malformed error object in response."), error);
}

auto JsonRpcMessage::toBaseMessage() const -> BaseMessage
{
  return BaseMessage(QJsonDocument(m_jsonObject).toJson(QJsonDocument::Compact));
}

} // namespace LspMux::LanguageServerProtocol
