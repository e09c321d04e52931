// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <utils/commandline.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QProcess>
#include <QTemporaryDir>
#include <QtTest>

using namespace LspMux::Utils;

class tst_App : public QObject {
  Q_OBJECT

private slots:
  void init();

  void list();
  void invokeHover();
  void invokeWithConfig();
  void unknownBackend();
  void invalidParams();
  void usage();

private:
  struct Result {
    int exitCode = -1;
    QByteArray out;
    QByteArray err;
  };

  auto run(const QStringList &arguments) -> Result;
  auto stubCommand() const -> QString;

  QScopedPointer<QTemporaryDir> m_workspace;
};

void tst_App::init()
{
  m_workspace.reset(new QTemporaryDir);
  QVERIFY(m_workspace->isValid());
}

auto tst_App::stubCommand() const -> QString
{
  return CommandLine(LSPMUX_STUBSERVER_PATH, {"normal", m_workspace->filePath("stub.log")}).toUserOutput();
}

auto tst_App::run(const QStringList &arguments) -> Result
{
  QProcess process;
  process.setWorkingDirectory(m_workspace->path());
  process.start(LSPMUX_APP_PATH, arguments);
  Result result;
  if (!process.waitForFinished(30000)) {
    process.kill();
    process.waitForFinished();
    return result;
  }
  result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
  result.out = process.readAllStandardOutput();
  result.err = process.readAllStandardError();
  return result;
}

void tst_App::list()
{
  const auto result = run({"--lsp-command", stubCommand(), "list"});
  QCOMPARE(result.exitCode, 0);
  const auto backends = QJsonDocument::fromJson(result.out).array();
  QCOMPARE(backends.size(), 1);
  const auto backend = backends.first().toObject();
  QCOMPARE(backend.value("id").toString(), QString("inline"));
  QCOMPARE(backend.value("extensions").toArray(), (QJsonArray{".py", ".pyi"}));
  QCOMPARE(backend.value("state").toString(), QString("not started"));
}

void tst_App::invokeHover()
{
  QFile file(m_workspace->filePath("a.py"));
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("value = 1\n");
  file.close();

  const auto result = run({"--lsp-command", stubCommand(), "--workspace", m_workspace->path(),
                           "invoke", "textDocument/hover", "--file", file.fileName(), "--line", "0", "--character", "2"});
  QVERIFY2(result.exitCode == 0, result.err.constData());
  const auto hover = QJsonDocument::fromJson(result.out).object();
  QCOMPARE(hover.value("contents").toObject().value("value").toString(), QString("**stub** hover"));
  QCOMPARE(hover.value("range").toObject().value("start").toObject().value("character").toInt(), 2);
}

void tst_App::invokeWithConfig()
{
  const QJsonObject configuration{
    {"workspace", m_workspace->path()},
    {"methods", QJsonArray{"textDocument/hover"}},
    {"backends", QJsonArray{QJsonObject{
      {"id", "stub"},
      {"command", LSPMUX_STUBSERVER_PATH},
      {"args", QJsonArray{"normal", m_workspace->filePath("stub.log")}},
      {"extensions", QJsonArray{".py"}}}}}};
  QFile config(m_workspace->filePath("lspmux.json"));
  QVERIFY(config.open(QIODevice::WriteOnly));
  config.write(QJsonDocument(configuration).toJson());
  config.close();

  // not on the allow-list
  const auto disabled = run({"--config", config.fileName(), "invoke", "textDocument/definition", "--backend", "stub"});
  QCOMPARE(disabled.exitCode, 1);
  QVERIFY(disabled.out.isEmpty());
  QVERIFY2(disabled.err.contains("MethodDisabled"), disabled.err.constData());

  // the configured backend replaces the default one
  const auto listed = run({"--config", config.fileName(), "list"});
  QCOMPARE(listed.exitCode, 0);
  QCOMPARE(QJsonDocument::fromJson(listed.out).array().first().toObject().value("id").toString(), QString("stub"));
}

void tst_App::unknownBackend()
{
  const auto result = run({"--lsp-command", stubCommand(), "invoke", "workspace/symbol", "--backend", "nope"});
  QCOMPARE(result.exitCode, 1);
  QVERIFY(result.out.isEmpty());
  QVERIFY2(result.err.contains("UnknownBackend"), result.err.constData());
}

void tst_App::invalidParams()
{
  const auto result = run({"--lsp-command", stubCommand(), "invoke", "workspace/symbol", "--params", "[1]"});
  QCOMPARE(result.exitCode, 1);
  QVERIFY(result.err.contains("--params"));
}

void tst_App::usage()
{
  QCOMPARE(run({}).exitCode, 1);
  QCOMPARE(run({"invoke"}).exitCode, 1);
  QCOMPARE(run({"frobnicate"}).exitCode, 1);
}

QTEST_GUILESS_MAIN(tst_App)

#include "tst_app.moc"
