// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <languageserverprotocol/languagefeatures.hpp>
#include <languageserverprotocol/lsptypes.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QtTest>

using namespace LspMux::LanguageServerProtocol;

static auto json(const char *text) -> QJsonValue
{
  // wrapped, so that scalars parse as well
  return QJsonDocument::fromJson(QByteArray("[") + text + "]").array().at(0);
}

class tst_LanguageFeatures : public QObject {
  Q_OBJECT

private slots:
  void documentUri();
  void languageIds_data();
  void languageIds();
  void nullResult();
  void hoverMarkupContent();
  void hoverMarkedStrings();
  void definitionVariants();
  void documentSymbolHierarchy();
  void documentSymbolFlat();
  void completionList();
  void renameEdit();
  void unknownMethodPassesThrough();
  void shapeMismatch_data();
  void shapeMismatch();
};

void tst_LanguageFeatures::documentUri()
{
  const auto uri = DocumentUri::fromFilePath("/tmp/some dir/main.py");
  QCOMPARE(uri, QString("file:///tmp/some%20dir/main.py"));
  QCOMPARE(DocumentUri::toFilePath(uri), QString("/tmp/some dir/main.py"));
  QVERIFY(DocumentUri::toFilePath("https://example.org/a.py").isEmpty());
}

void tst_LanguageFeatures::languageIds_data()
{
  QTest::addColumn<QString>("path");
  QTest::addColumn<QString>("languageId");

  QTest::newRow("python") << "/src/a.py" << "python";
  QTest::newRow("stub") << "/src/a.PYI" << "python";
  QTest::newRow("rust") << "lib.rs" << "rust";
  QTest::newRow("c++ header") << "x.hpp" << "cpp";
  QTest::newRow("unknown") << "notes.xyz" << "";
}

void tst_LanguageFeatures::languageIds()
{
  QFETCH(QString, path);
  QFETCH(QString, languageId);
  QCOMPARE(languageIdForFile(path), languageId);
}

void tst_LanguageFeatures::nullResult()
{
  for (const auto &method : {Methods::hover, Methods::definition, Methods::completion}) {
    const auto decoded = ResultDecoder::decode(method, QJsonValue(), nullptr);
    QVERIFY(decoded);
    QVERIFY(std::holds_alternative<std::nullptr_t>(*decoded));
  }
}

void tst_LanguageFeatures::hoverMarkupContent()
{
  const auto result = json(R"({"contents":{"kind":"markdown","value":"**int** x"},
                               "range":{"start":{"line":3,"character":4},"end":{"line":3,"character":5}}})");
  const auto decoded = ResultDecoder::decode(Methods::hover, result, nullptr);
  QVERIFY(decoded);
  const auto hover = std::get_if<Hover>(&*decoded);
  QVERIFY(hover);
  QCOMPARE(hover->contents.size(), 1);
  QCOMPARE(hover->contents.first().kind, QString("markdown"));
  QCOMPARE(hover->contents.first().value, QString("**int** x"));
  QVERIFY(hover->range);
  QCOMPARE(hover->range->start, Position(3, 4));
  QCOMPARE(hover->range->end, Position(3, 5));
}

void tst_LanguageFeatures::hoverMarkedStrings()
{
  const auto hover = ResultDecoder::decodeHover(json(R"({"contents":["plain",{"language":"python","value":"def f()"}]})"));
  QVERIFY(hover);
  QCOMPARE(hover->contents.size(), 2);
  QCOMPARE(hover->contents.at(0).value, QString("plain"));
  QCOMPARE(hover->contents.at(1).language, QString("python"));
  QVERIFY(!hover->range);
}

void tst_LanguageFeatures::definitionVariants()
{
  const auto single = ResultDecoder::decodeLocations(
    json(R"({"uri":"file:///a.py","range":{"start":{"line":1,"character":0},"end":{"line":1,"character":3}}})"));
  QVERIFY(single);
  QCOMPARE(single->size(), 1);
  QCOMPARE(single->first().filePath(), QString("/a.py"));

  const auto links = ResultDecoder::decodeLocations(json(R"([{"targetUri":"file:///b.py",
      "targetRange":{"start":{"line":0,"character":0},"end":{"line":9,"character":0}},
      "targetSelectionRange":{"start":{"line":2,"character":4},"end":{"line":2,"character":8}}}])"));
  QVERIFY(links);
  QCOMPARE(links->size(), 1);
  QCOMPARE(links->first().uri, QString("file:///b.py"));
  QCOMPARE(links->first().range, Range(Position(2, 4), Position(2, 8)));

  const auto empty = ResultDecoder::decode(Methods::references, QJsonArray(), nullptr);
  QVERIFY(empty);
  QVERIFY(std::get<QList<Location>>(*empty).isEmpty());
}

void tst_LanguageFeatures::documentSymbolHierarchy()
{
  const auto result = json(R"([{"name":"Foo","kind":5,
      "range":{"start":{"line":0,"character":0},"end":{"line":10,"character":0}},
      "selectionRange":{"start":{"line":0,"character":6},"end":{"line":0,"character":9}},
      "children":[{"name":"bar","kind":6,
        "range":{"start":{"line":1,"character":4},"end":{"line":2,"character":0}},
        "selectionRange":{"start":{"line":1,"character":8},"end":{"line":1,"character":11}}}]}])");
  const auto decoded = ResultDecoder::decode(Methods::documentSymbol, result, nullptr);
  QVERIFY(decoded);
  const auto symbols = std::get_if<QList<DocumentSymbol>>(&*decoded);
  QVERIFY(symbols);
  QCOMPARE(symbols->size(), 1);
  QCOMPARE(symbols->first().name, QString("Foo"));
  QCOMPARE(symbols->first().children.size(), 1);
  QCOMPARE(symbols->first().children.first().name, QString("bar"));
}

void tst_LanguageFeatures::documentSymbolFlat()
{
  const auto result = json(R"([{"name":"main","kind":12,"containerName":"mod",
      "location":{"uri":"file:///m.py","range":{"start":{"line":4,"character":0},"end":{"line":8,"character":0}}}}])");
  const auto decoded = ResultDecoder::decode(Methods::documentSymbol, result, nullptr);
  QVERIFY(decoded);
  const auto symbols = std::get_if<QList<SymbolInformation>>(&*decoded);
  QVERIFY(symbols);
  QCOMPARE(symbols->first().containerName, QString("mod"));
  QCOMPARE(symbols->first().location.range.start.line, 4);

  // workspace symbols without range
  const auto workspaceSymbols = ResultDecoder::decodeSymbolInformation(json(R"([{"name":"Foo","kind":5,"location":{"uri":"file:///f.py"}}])"));
  QVERIFY(workspaceSymbols);
  QCOMPARE(workspaceSymbols->first().location.uri, QString("file:///f.py"));
}

void tst_LanguageFeatures::completionList()
{
  const auto fromList = ResultDecoder::decodeCompletion(json(R"({"isIncomplete":true,"items":[
      {"label":"append","kind":2,"documentation":{"kind":"markdown","value":"Append an item."}},
      {"label":"clear","insertText":"clear()"}]})"));
  QVERIFY(fromList);
  QVERIFY(fromList->isIncomplete);
  QCOMPARE(fromList->items.size(), 2);
  QCOMPARE(fromList->items.at(0).kind, std::make_optional(2));
  QCOMPARE(fromList->items.at(0).documentation, QString("Append an item."));
  QVERIFY(!fromList->items.at(1).kind);
  QCOMPARE(fromList->items.at(1).insertText, QString("clear()"));

  const auto fromArray = ResultDecoder::decodeCompletion(json(R"([{"label":"x"}])"));
  QVERIFY(fromArray);
  QVERIFY(!fromArray->isIncomplete);
  QCOMPARE(fromArray->items.size(), 1);
}

void tst_LanguageFeatures::renameEdit()
{
  const auto edit = ResultDecoder::decodeWorkspaceEdit(json(R"({
      "changes":{"file:///a.py":[{"range":{"start":{"line":0,"character":0},"end":{"line":0,"character":3}},"newText":"bar"}]},
      "documentChanges":[
        {"textDocument":{"uri":"file:///b.py","version":3},
         "edits":[{"range":{"start":{"line":1,"character":0},"end":{"line":1,"character":3}},"newText":"bar"}]},
        {"kind":"create","uri":"file:///c.py"}]})"));
  QVERIFY(edit);
  QCOMPARE(edit->changes.size(), 2);
  QCOMPARE(edit->changes.value("file:///a.py").first().newText, QString("bar"));
  QCOMPARE(edit->changes.value("file:///b.py").first().range.start.line, 1);
}

void tst_LanguageFeatures::unknownMethodPassesThrough()
{
  const auto result = json(R"({"anything":[1,2,3]})");
  const auto decoded = ResultDecoder::decode("textDocument/semanticTokens/full", result, nullptr);
  QVERIFY(decoded);
  QCOMPARE(std::get<QJsonValue>(*decoded), result);
}

void tst_LanguageFeatures::shapeMismatch_data()
{
  QTest::addColumn<QString>("method");
  QTest::addColumn<QByteArray>("result");

  QTest::newRow("hover array") << QString(Methods::hover) << QByteArray("[1]");
  QTest::newRow("hover without contents") << QString(Methods::hover) << QByteArray(R"({"range":null})");
  QTest::newRow("definition string") << QString(Methods::definition) << QByteArray(R"("file:///a.py")");
  QTest::newRow("completion number") << QString(Methods::completion) << QByteArray("3");
  QTest::newRow("symbol without name") << QString(Methods::workspaceSymbol) << QByteArray(R"([{"kind":1}])");
}

void tst_LanguageFeatures::shapeMismatch()
{
  QFETCH(QString, method);
  QFETCH(QByteArray, result);

  QString errorMessage;
  QVERIFY(!ResultDecoder::decode(method, json(result.constData()), &errorMessage));
  QVERIFY(errorMessage.contains(method));
}

QTEST_GUILESS_MAIN(tst_LanguageFeatures)

#include "tst_languagefeatures.moc"
