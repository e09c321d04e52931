// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <languageclient/languageclientinterface.hpp>
#include <languageserverprotocol/languagefeatures.hpp>

#include <QBuffer>
#include <QMutex>

#include <atomic>
#include <functional>
#include <optional>

namespace LspMux::LanguageClient::Tests {

// An in-process language server. It answers initialize and shutdown itself and hands every other
// request to a handler, which may answer at once, later or never.
class FakeClientInterface : public BaseClientInterface {
public:
  using RequestHandler = std::function<void(FakeClientInterface *server, const LanguageServerProtocol::JsonRpcMessage &request)>;

  explicit FakeClientInterface(const QJsonObject &capabilities = QJsonObject{{"hoverProvider", true}}) : m_capabilities(capabilities) {}

  auto start() -> bool override
  {
    m_started = true;
    return m_canStart;
  }

  auto stop(int graceMsecs) -> bool override
  {
    Q_UNUSED(graceMsecs)
    m_stopped = true;
    return m_exits;
  }

  auto abort() -> void override { m_aborted = true; }
  auto errorString() const -> QString override { return m_errorString; }

  auto receive(const LanguageServerProtocol::JsonRpcMessage &message) -> void { emit messageReceived(message.toBaseMessage()); }
  auto receiveData(const QByteArray &data) -> void { parseData(data); }
  auto reply(const LanguageServerProtocol::JsonRpcMessage &request, const QJsonValue &result) -> void { receive(LanguageServerProtocol::JsonRpcMessage::response(request.id(), result)); }
  auto finish() -> void { emit finished(); }

  // With m_holdInitialize the initialize request stays unanswered until this is called.
  auto releaseInitialize() -> bool
  {
    std::optional<LanguageServerProtocol::JsonRpcMessage> held;
    {
      QMutexLocker locker(&m_mutex);
      held.swap(m_heldInitialize);
    }
    if (!held)
      return false;
    answerInitialize(*held);
    return true;
  }

  auto sent() const -> QList<LanguageServerProtocol::JsonRpcMessage>
  {
    QMutexLocker locker(&m_mutex);
    return m_sent;
  }

  auto sent(const QString &method) const -> QList<LanguageServerProtocol::JsonRpcMessage>
  {
    QList<LanguageServerProtocol::JsonRpcMessage> result;
    for (const auto &message : sent()) {
      if (message.method() == method)
        result.append(message);
    }
    return result;
  }

  // the responses the client sent to server requests
  auto responseTo(const LanguageServerProtocol::MessageId &id) const -> std::optional<LanguageServerProtocol::JsonRpcMessage>
  {
    for (const auto &message : sent()) {
      if (message.kind() == LanguageServerProtocol::JsonRpcMessage::Response && message.id() == id)
        return message;
    }
    return std::nullopt;
  }

  QJsonObject m_capabilities;
  QString m_errorString;
  bool m_canStart = true;
  bool m_exits = true;
  bool m_answerShutdown = true;
  std::atomic_bool m_holdInitialize{false};
  std::optional<LanguageServerProtocol::ResponseError> m_initializeError;
  RequestHandler m_requestHandler;
  std::atomic_bool m_started{false};
  std::atomic_bool m_stopped{false};
  std::atomic_bool m_aborted{false};

protected:
  auto sendData(const QByteArray &data) -> void override
  {
    using namespace LspMux::LanguageServerProtocol;

    QBuffer buffer;
    buffer.setData(data);
    buffer.open(QIODevice::ReadOnly);
    QString parseError;
    BaseMessage frame;
    BaseMessage::parse(&buffer, parseError, frame);
    const auto message = JsonRpcMessage::fromBaseMessage(frame, &parseError);
    {
      QMutexLocker locker(&m_mutex);
      m_sent.append(message);
    }
    if (message.kind() != JsonRpcMessage::Request)
      return;

    if (message.method() == Methods::initialize) {
      if (m_holdInitialize) {
        QMutexLocker locker(&m_mutex);
        m_heldInitialize = message;
        return;
      }
      answerInitialize(message);
    } else if (message.method() == Methods::shutdown) {
      if (m_answerShutdown)
        reply(message, QJsonValue::Null);
    } else if (m_requestHandler) {
      m_requestHandler(this, message);
    }
  }

private:
  auto answerInitialize(const LanguageServerProtocol::JsonRpcMessage &request) -> void
  {
    using namespace LspMux::LanguageServerProtocol;

    if (m_initializeError)
      receive(JsonRpcMessage::errorResponse(request.id(), *m_initializeError));
    else
      reply(request, QJsonObject{{"capabilities", m_capabilities}, {"serverInfo", QJsonObject{{"name", "fake"}, {"version", "1.2"}}}});
  }

  mutable QMutex m_mutex;
  QList<LanguageServerProtocol::JsonRpcMessage> m_sent;
  std::optional<LanguageServerProtocol::JsonRpcMessage> m_heldInitialize;
};

} // namespace LspMux::LanguageClient::Tests
