// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <languageserverprotocol/jsonrpcmessages.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>

using namespace LspMux::LanguageServerProtocol;

Q_DECLARE_METATYPE(JsonRpcMessage::Kind)

class tst_JsonRpcMessages : public QObject {
  Q_OBJECT

private slots:
  void messageId();
  void kind_data();
  void kind();
  void fromBaseMessageErrors_data();
  void fromBaseMessageErrors();
  void requestWithoutParams();
  void responseWithNullResult();
  void errorResponse();
  void malformedError();
};

void tst_JsonRpcMessages::messageId()
{
  QVERIFY(!MessageId().isValid());
  QVERIFY(MessageId(0).isValid());
  QCOMPARE(MessageId(QJsonValue(7)), MessageId(7));
  QCOMPARE(MessageId(QJsonValue("7")), MessageId(QString("7")));
  QVERIFY(MessageId(QJsonValue(7)) != MessageId(QString("7")));
  QVERIFY(!MessageId(QJsonValue(1.5)).isValid());
  QVERIFY(!MessageId(QJsonValue()).isValid());
  QCOMPARE(MessageId(42).toJson(), QJsonValue(42));
  QCOMPARE(MessageId(QString("abc")).toString(), QString("abc"));

  QHash<MessageId, int> ids;
  ids.insert(MessageId(1), 1);
  ids.insert(MessageId(QString("1")), 2);
  QCOMPARE(ids.size(), 2);
  QCOMPARE(ids.value(MessageId(1)), 1);
}

void tst_JsonRpcMessages::kind_data()
{
  QTest::addColumn<QByteArray>("json");
  QTest::addColumn<JsonRpcMessage::Kind>("kind");

  QTest::newRow("request") << QByteArray(R"({"jsonrpc":"2.0","id":1,"method":"shutdown"})") << JsonRpcMessage::Request;
  QTest::newRow("request with string id") << QByteArray(R"({"jsonrpc":"2.0","id":"a","method":"workspace/configuration","params":{}})") << JsonRpcMessage::Request;
  QTest::newRow("notification") << QByteArray(R"({"jsonrpc":"2.0","method":"$/progress","params":{}})") << JsonRpcMessage::Notification;
  QTest::newRow("response") << QByteArray(R"({"jsonrpc":"2.0","id":3,"result":{"a":1}})") << JsonRpcMessage::Response;
  QTest::newRow("error response") << QByteArray(R"({"jsonrpc":"2.0","id":3,"error":{"code":-32601,"message":"no"}})") << JsonRpcMessage::Response;
  QTest::newRow("neither") << QByteArray(R"({"jsonrpc":"2.0","result":1})") << JsonRpcMessage::Invalid;
}

void tst_JsonRpcMessages::kind()
{
  QFETCH(QByteArray, json);
  QFETCH(JsonRpcMessage::Kind, kind);

  QString parseError;
  const auto message = JsonRpcMessage::fromBaseMessage(BaseMessage(json), &parseError);
  QCOMPARE(message.kind(), kind);
  QCOMPARE(parseError.isEmpty(), kind != JsonRpcMessage::Invalid);
}

void tst_JsonRpcMessages::fromBaseMessageErrors_data()
{
  QTest::addColumn<QByteArray>("content");

  QTest::newRow("truncated") << QByteArray(R"({"jsonrpc":"2.0",)");
  QTest::newRow("array") << QByteArray("[1,2]");
  QTest::newRow("not json") << QByteArray("Content-Length");
}

void tst_JsonRpcMessages::fromBaseMessageErrors()
{
  QFETCH(QByteArray, content);

  QString parseError;
  const auto message = JsonRpcMessage::fromBaseMessage(BaseMessage(content), &parseError);
  QVERIFY(!message.isValid());
  QVERIFY(!parseError.isEmpty());
}

void tst_JsonRpcMessages::requestWithoutParams()
{
  const auto request = JsonRpcMessage::request(MessageId(5), "shutdown");
  const auto object = request.toJson();
  QCOMPARE(object.value("jsonrpc").toString(), QString("2.0"));
  QCOMPARE(object.value("id").toInt(), 5);
  QVERIFY(!object.contains("params"));

  const auto notification = JsonRpcMessage::notification("initialized", QJsonObject());
  QVERIFY(notification.toJson().value("params").isObject());
  QVERIFY(!notification.toJson().contains("id"));
}

void tst_JsonRpcMessages::responseWithNullResult()
{
  const auto response = JsonRpcMessage::response(MessageId(2), QJsonValue(QJsonValue::Undefined));
  const auto content = response.toBaseMessage().content;
  QVERIFY(content.contains("\"result\":null"));
  QCOMPARE(response.kind(), JsonRpcMessage::Response);
  QVERIFY(!response.error());
}

void tst_JsonRpcMessages::errorResponse()
{
  const ResponseError error(ResponseError::MethodNotFound, "Unsupported method", QJsonArray{1});
  const auto response = JsonRpcMessage::errorResponse(MessageId(QString("srv-1")), error);

  QString parseError;
  const auto parsed = JsonRpcMessage::fromBaseMessage(response.toBaseMessage(), &parseError);
  QCOMPARE(parsed.id(), MessageId(QString("srv-1")));
  const auto parsedError = parsed.error();
  QVERIFY(parsedError);
  QCOMPARE(parsedError->code, int(ResponseError::MethodNotFound));
  QCOMPARE(parsedError->message, QString("Unsupported method"));
  QCOMPARE(parsedError->data, QJsonValue(QJsonArray{1}));
}

void tst_JsonRpcMessages::malformedError()
{
  const JsonRpcMessage message(QJsonObject{{"jsonrpc", "2.0"}, {"id", 1}, {"error", "boom"}});
  const auto error = message.error();
  QVERIFY(error);
  QCOMPARE(error->code, int(ResponseError::InternalError));
  QCOMPARE(error->data, QJsonValue("boom"));
}

QTEST_GUILESS_MAIN(tst_JsonRpcMessages)

#include "tst_jsonrpcmessages.moc"
