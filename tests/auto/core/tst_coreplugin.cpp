// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <core/core-buffers.hpp>
#include <core/core-constants.hpp>
#include <core/core-editor.hpp>
#include <core/core-interface.hpp>
#include <core/core-plugin.hpp>
#include <core/core-script-engine.hpp>
#include <core/core-tab-widget.hpp>
#include <core/core-window.hpp>

#include <extensionsystem/connector.hpp>
#include <extensionsystem/listener.hpp>
#include <extensionsystem/pluginmanager.hpp>

#include <QDir>
#include <QFile>
#include <QPointer>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QWheelEvent>
#include <QtTest>

#include <memory>

using namespace Eye::Plugin::Core;
using namespace ExtensionSystem;

class tst_CorePlugin : public QObject {
  Q_OBJECT

private slots:
  void initTestCase();
  void cleanup();
  void cleanupTestCase();

  void coreInterface();
  void startupScripts();
  void zoomOnWheel();
  void openEditor();
  void reopenClosedEditor();

private:
  auto sendWheel(Editor *editor, int delta, Qt::KeyboardModifiers modifiers) -> void;

  QTemporaryDir m_dir;
  std::unique_ptr<PluginManager> m_manager;
};

void tst_CorePlugin::initTestCase()
{
  QVERIFY(m_dir.isValid());
  ICore::setConfigPath(m_dir.path());

  m_manager = std::make_unique<PluginManager>();
  PluginManager::addPlugin(new CorePlugin, "Core", "the editor core", PluginManager::Required);
  PluginManager::loadPlugins();
  QVERIFY(!PluginManager::hasError());
  QVERIFY(CorePlugin::instance());
}

void tst_CorePlugin::cleanup()
{
  for (const auto window : ICore::windows())
    delete window;
}

void tst_CorePlugin::cleanupTestCase()
{
  PluginManager::shutdown();
  QVERIFY(!CorePlugin::instance());
  m_manager.reset();
}

void tst_CorePlugin::coreInterface()
{
  QVERIFY(ICore::instance());
  QVERIFY(ICore::scriptEngine());
  QCOMPARE(ICore::configPath("x.session"), QDir(m_dir.path()).absoluteFilePath("x.session"));
  QCOMPARE(ICore::startupScriptsPath(), QDir(m_dir.path()).absoluteFilePath(Constants::STARTUP_DIR));

  QSignalSpy created(ICore::instance(), &ICore::windowCreated);
  const auto window = ICore::createWindow();
  QCOMPARE(created.count(), 1);
  QVERIFY(ICore::windows().contains(window));
}

void tst_CorePlugin::startupScripts()
{
  QVERIFY(QDir().mkpath(ICore::startupScriptsPath()));
  QFile script(QDir(ICore::startupScriptsPath()).filePath("10-setup.js"));
  QVERIFY(script.open(QIODevice::WriteOnly));
  script.write("var configured = eye.configPath('startup');\n");
  script.close();

  QSignalSpy opened(ICore::instance(), &ICore::coreOpened);
  QCOMPARE(CorePlugin::instance()->runStartupScripts(), 1);
  QCOMPARE(opened.count(), 1);

  QString error;
  QCOMPARE(ICore::scriptEngine()->evaluate("configured", {}, &error).toString(), ICore::startupScriptsPath());
  QVERIFY(error.isEmpty());
}

auto tst_CorePlugin::sendWheel(Editor *editor, const int delta, const Qt::KeyboardModifiers modifiers) -> void
{
  const QPointF position(5, 5);
  QWheelEvent event(position, editor->viewport()->mapToGlobal(position.toPoint()), QPoint(), QPoint(0, delta), Qt::NoButton, modifiers, Qt::NoScrollPhase, false);
  QCoreApplication::sendEvent(editor->viewport(), &event);
}

void tst_CorePlugin::zoomOnWheel()
{
  const auto zoom = listener(Constants::L_ZOOM_ON_WHEEL);
  QVERIFY(zoom);
  QVERIFY(!zoom->isEnabled());

  Editor editor;
  editor.setPlainText("text");
  const auto size = editor.font().pointSize();

  sendWheel(&editor, 120, Qt::ControlModifier);
  QCOMPARE(editor.font().pointSize(), size);

  QVERIFY(setListenerEnabled(Constants::L_ZOOM_ON_WHEEL, true));
  sendWheel(&editor, 120, Qt::ControlModifier);
  QVERIFY(editor.font().pointSize() > size);

  sendWheel(&editor, -120, Qt::ControlModifier);
  QCOMPARE(editor.font().pointSize(), size);

  sendWheel(&editor, 120, Qt::NoModifier);
  QCOMPARE(editor.font().pointSize(), size);

  QVERIFY(setListenerEnabled(Constants::L_ZOOM_ON_WHEEL, false));
}

void tst_CorePlugin::openEditor()
{
  const auto path = m_dir.filePath("opened.txt");
  QFile file(path);
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("one\ntwo\nthree\n");
  file.close();

  const auto window = ICore::createWindow();
  window->show();
  QVERIFY(QTest::qWaitForWindowExposed(window));

  QString error;
  const auto editor = ICore::scriptEngine()->evaluate(QString("eye.openEditor('%1', 3, 2)").arg(path), {}, &error);
  QVERIFY2(error.isEmpty(), qPrintable(error));
  QVERIFY(editor.isQObject());

  const auto opened = qobject_cast<Editor*>(editor.toQObject());
  QVERIFY(opened);
  QCOMPARE(opened->cursorLine(), 2);
  QCOMPARE(opened->cursorColumn(), 1);
  QCOMPARE(Buffers::findEditor(path), opened);
}

void tst_CorePlugin::reopenClosedEditor()
{
  const auto path = m_dir.filePath("reopened.txt");
  QFile file(path);
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("text\n");
  file.close();

  const auto window = ICore::createWindow();
  window->show();
  QVERIFY(QTest::qWaitForWindowExposed(window));

  const QPointer<Editor> closed = Buffers::openEditor(path);
  QVERIFY(closed);
  const auto tabs = closed->parentTabWidget();
  QVERIFY(tabs);
  QVERIFY(tabs->closeTab(closed));

  // Not deleted yet, but no longer reachable.
  QVERIFY(closed);
  QVERIFY(!Buffers::findEditor(path));
  QVERIFY(!Buffers::listEditors().contains(path));
  QVERIFY(window->currentBuffer() != closed.data());

  const auto reopened = Buffers::openEditor(path);
  QVERIFY(reopened);
  QVERIFY(reopened != closed.data());
  QCOMPARE(reopened->window(), static_cast<QWidget*>(window));
  QCOMPARE(reopened->toPlainText(), QString("text"));
  QCOMPARE(Buffers::findEditor(path), reopened);

  QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
  QVERIFY(!closed);
}

QTEST_MAIN(tst_CorePlugin)

#include "tst_coreplugin.moc"
