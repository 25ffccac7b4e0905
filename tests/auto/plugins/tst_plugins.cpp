// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <core/core-editor.hpp>
#include <core/core-interface.hpp>
#include <core/core-splitter.hpp>
#include <core/core-tab-widget.hpp>
#include <core/core-window.hpp>

#include <extensionsystem/eventconnector.hpp>
#include <extensionsystem/iplugin.hpp>

#include <filemonitor/filemonitor-monitor.hpp>
#include <filemonitor/filemonitor-plugin.hpp>
#include <navhistory/navhistory-plugin.hpp>
#include <session/session-plugin.hpp>
#include <session/session-serializer.hpp>

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QPointer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QtTest>

#include <memory>

using namespace Eye::Plugin;
using namespace Eye::Plugin::Core;

static auto writeFile(const QString &path, const QByteArray &data) -> bool
{
  QFile file(path);
  return file.open(QIODevice::WriteOnly) && file.write(data) == data.size();
}

static auto flushDeletes() -> void
{
  QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

static auto removeListeners(const ExtensionSystem::IPlugin *plugin) -> void
{
  for (const auto listener : plugin->listeners())
    ExtensionSystem::EventConnector::instance()->removeListener(listener);
}

// Drops the binary splitter state, which depends on the window size.
static auto withoutState(QJsonObject object) -> QJsonObject
{
  object.remove("qstate");
  if (object.contains("items")) {
    QJsonArray items;
    for (const auto &item : object.value("items").toArray())
      items.append(withoutState(item.toObject()));
    object.insert("items", items);
  }
  return object;
}

class tst_Plugins : public QObject {
  Q_OBJECT

private slots:
  void initTestCase();
  void cleanup();

  void historyRecord();
  void historyPop();
  void historyPopSkipsDeadEditors();
  void historyFollowsCursor();

  void monitorSharesWatchers();
  void monitorReportsChanges();
  void fileMonitorPlugin();
  void fileMonitorIgnoresOwnSave();

  void serializeEditor();
  void sessionRoundTrip();
  void restoreInvalidSession();
  void restoreReplacesPristineWindows();

private:
  QTemporaryDir m_dir;
};

void tst_Plugins::initTestCase()
{
  QVERIFY(m_dir.isValid());
  ICore::setConfigPath(m_dir.filePath("config"));
}

void tst_Plugins::cleanup()
{
  for (const auto window : ICore::windows())
    delete window;
  flushDeletes();
}

void tst_Plugins::historyRecord()
{
  NavHistory::NavHistory history;
  Editor a;
  Editor b;

  history.record(&a, 1, 1);
  history.record(&a, 5, 2);
  QCOMPARE(history.size(), 1);
  QCOMPARE(history.peek()->line, 5);

  history.record(&b, 3, 0);
  history.record(&a, 7, 0);
  QCOMPARE(history.size(), 3);
  QCOMPARE(history.peek()->editor.data(), &a);

  history.push(&a, 8, 0);
  QCOMPARE(history.size(), 4);

  const auto top = history.peekHistory();
  QCOMPARE(top.value("editor").value<QObject*>(), &a);
  QCOMPARE(top.value("line").toInt(), 8);
  QCOMPARE(top.value("column").toInt(), 0);

  history.clear();
  QVERIFY(!history.peek());
  QVERIFY(history.peekHistory().isEmpty());
}

void tst_Plugins::historyPop()
{
  NavHistory::NavHistory history;
  Editor a;
  Editor b;
  a.setPlainText("one\ntwo\nthree\n");

  history.push(&a, 2, 3);
  history.push(&b, 0, 0);

  QSignalSpy spy(&history, &NavHistory::NavHistory::jumped);
  QVERIFY(history.popHistory(&b));
  QCOMPARE(spy.count(), 1);
  QCOMPARE(spy.at(0).at(1).toInt(), 2);
  QCOMPARE(a.cursorLine(), 2);
  QCOMPARE(a.cursorColumn(), 3);
  QCOMPARE(history.size(), 0);

  QVERIFY(!history.popHistory(&b));
}

void tst_Plugins::historyPopSkipsDeadEditors()
{
  NavHistory::NavHistory history;
  Editor a;
  auto b = std::make_unique<Editor>();

  history.push(&a, 0, 0);
  history.push(b.get(), 0, 0);
  b.reset();
  QVERIFY(!history.peek());

  QSignalSpy spy(&history, &NavHistory::NavHistory::jumped);
  QVERIFY(history.popHistory(nullptr));
  QCOMPARE(spy.at(0).at(0).value<Editor*>(), &a);
}

void tst_Plugins::historyFollowsCursor()
{
  NavHistory::NavHistoryPlugin plugin;
  QString error;
  QVERIFY(plugin.initialize({}, &error));

  Editor editor;
  editor.setPlainText("one\ntwo\nthree\n");
  editor.goto1(2, 1);
  QCOMPARE(plugin.history()->size(), 0);

  plugin.setEnabled(true);
  editor.goto1(3, 2);
  editor.goto1(1, 1);
  QCOMPARE(plugin.history()->size(), 1);
  QCOMPARE(plugin.history()->peek()->line, 0);

  plugin.setEnabled(false);
  QCOMPARE(plugin.history()->size(), 0);
  editor.goto1(3, 1);
  QCOMPARE(plugin.history()->size(), 0);

  removeListeners(&plugin);
}

void tst_Plugins::monitorSharesWatchers()
{
  const auto path = m_dir.filePath("shared.txt");
  QVERIFY(writeFile(path, "x"));

  FileMonitor::Monitor monitor;
  auto first = monitor.monitorFile(path);
  auto second = monitor.monitorFile(path);
  QCOMPARE(first.get(), second.get());
  QVERIFY(monitor.isMonitored(path));
  QCOMPARE(monitor.files().size(), 1);

  first.reset();
  QVERIFY(monitor.isMonitored(path));
  second.reset();
  QVERIFY(!monitor.isMonitored(path));
  QVERIFY(monitor.files().isEmpty());
}

void tst_Plugins::monitorReportsChanges()
{
  const auto path = m_dir.filePath("changing.txt");
  QVERIFY(writeFile(path, "before"));

  FileMonitor::Monitor monitor;
  const auto watcher = monitor.monitorFile(path);
  QSignalSpy spy(watcher.get(), &FileMonitor::SingleFileWatcher::modified);

  QVERIFY(writeFile(path, "after"));
  QVERIFY(spy.wait());

  spy.clear();
  QVERIFY(QFile::remove(path));
  QVERIFY(writeFile(path, "recreated"));
  QVERIFY(spy.count() > 0 || spy.wait());
}

void tst_Plugins::fileMonitorPlugin()
{
  const auto path = m_dir.filePath("monitored.txt");
  QVERIFY(writeFile(path, "text\n"));

  FileMonitor::FileMonitorPlugin plugin;
  QString error;
  QVERIFY(plugin.initialize({}, &error));

  Editor dormant;
  QVERIFY(dormant.openFile(path));
  QVERIFY(!plugin.watcher(&dormant));

  plugin.setEnabled(true);
  auto editor = std::make_unique<Editor>();
  QVERIFY(editor->openFile(path));
  QVERIFY(plugin.watcher(editor.get()));
  QVERIFY(plugin.monitor()->isMonitored(path));

  QSignalSpy spy(editor.get(), &Editor::fileModifiedExternally);
  QVERIFY(writeFile(path, "changed\n"));
  QVERIFY(spy.wait());

  editor.reset();
  QVERIFY(!plugin.monitor()->isMonitored(path));

  removeListeners(&plugin);
}

void tst_Plugins::fileMonitorIgnoresOwnSave()
{
  const auto path = m_dir.filePath("saved.txt");
  QVERIFY(writeFile(path, "text\n"));

  FileMonitor::FileMonitorPlugin plugin;
  QString error;
  QVERIFY(plugin.initialize({}, &error));
  plugin.setEnabled(true);

  Editor editor;
  QVERIFY(editor.openFile(path));
  QSignalSpy spy(&editor, &Editor::fileModifiedExternally);

  editor.setPlainText("new text\n");
  QVERIFY(editor.saveFile());
  QVERIFY(plugin.watcher(&editor));
  QTest::qWait(300);
  QCOMPARE(spy.count(), 0);

  plugin.setEnabled(false);
  QVERIFY(!plugin.watcher(&editor));

  removeListeners(&plugin);
}

void tst_Plugins::serializeEditor()
{
  const auto path = m_dir.filePath("serialized.txt");
  QVERIFY(writeFile(path, "one\ntwo\n"));

  Editor editor;
  QVERIFY(editor.openFile(path));
  editor.goto1(2, 3);

  const auto data = Session::SessionSerializer::serializeEditor(&editor);
  QCOMPARE(data.value("type").toString(), QString("editor"));
  QCOMPARE(data.value("path").toString(), editor.path());
  QCOMPARE(data.value("cursor").toArray(), (QJsonArray{1, 2}));
}

void tst_Plugins::sessionRoundTrip()
{
  const auto first = m_dir.filePath("first.txt");
  const auto second = m_dir.filePath("second.txt");
  QVERIFY(writeFile(first, "a\nb\nc\n"));
  QVERIFY(writeFile(second, "x\ny\n"));

  const auto window = ICore::createWindow();
  const auto editor = window->currentBuffer();
  QVERIFY(editor->openFile(first));
  editor->goto1(3, 1);

  const auto tabs = new TabWidget;
  const auto other = new Editor;
  tabs->addEditor(other);
  QVERIFY(other->openFile(second));
  window->splitManager()->splitAt(editor->parentTabWidget(), Qt::Vertical, tabs);

  const auto saved = withoutState(Session::SessionSerializer::serializeWindow(window).value("splitter").toObject());
  const auto session_path = m_dir.filePath("round.session");
  QString error;
  QVERIFY2(Session::saveSession(session_path, &error), qPrintable(error));

  delete window;
  QVERIFY(ICore::windows().isEmpty());

  const auto windows = Session::restoreSession(session_path, &error);
  QCOMPARE(windows.size(), 1);
  flushDeletes();
  const auto restored = withoutState(Session::SessionSerializer::serializeWindow(windows.first()).value("splitter").toObject());
  QCOMPARE(restored, saved);
}

void tst_Plugins::restoreInvalidSession()
{
  const auto path = m_dir.filePath("invalid.session");
  QVERIFY(writeFile(path, "{ not json"));

  QString error;
  QVERIFY(Session::restoreSession(path, &error).isEmpty());
  QVERIFY(error.contains("invalid.session"));

  QVERIFY(writeFile(path, "{\"windows\": 3}"));
  error.clear();
  QVERIFY(Session::restoreSession(path, &error).isEmpty());
  QVERIFY(!error.isEmpty());

  error.clear();
  QVERIFY(Session::restoreSession(m_dir.filePath("missing.session"), &error).isEmpty());
  QVERIFY(!error.isEmpty());
}

void tst_Plugins::restoreReplacesPristineWindows()
{
  const auto path = m_dir.filePath("kept.txt");
  QVERIFY(writeFile(path, "kept\n"));

  Session::SessionPlugin plugin;
  QString error;
  QVERIFY(plugin.initialize({}, &error));

  const auto window = ICore::createWindow();
  QVERIFY(window->currentBuffer()->openFile(path));
  const auto opened = window->currentBuffer()->path();
  QVERIFY(plugin.save());
  QVERIFY(QFileInfo::exists(Session::SessionPlugin::sessionPath()));
  delete window;

  QPointer<Window> pristine = ICore::createWindow();
  pristine->show();
  QPointer<Window> modified = ICore::createWindow();
  modified->currentBuffer()->setPlainText("unsaved");

  const auto windows = plugin.restore();
  QCOMPARE(windows.size(), 1);
  flushDeletes();
  QCOMPARE(windows.first()->currentBuffer()->path(), opened);

  QVERIFY(!pristine);
  QVERIFY(modified);
  modified->currentBuffer()->setModified(false);

  removeListeners(&plugin);
}

QTEST_MAIN(tst_Plugins)

#include "tst_plugins.moc"
