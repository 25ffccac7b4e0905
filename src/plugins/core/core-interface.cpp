// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-interface.hpp"

#include "core-constants.hpp"
#include "core-window.hpp"

#include <extensionsystem/connector.hpp>
#include <extensionsystem/pluginmanager.hpp>

#include <utils/qtcassert.hpp>

#include <QApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

/*!
    \namespace Eye::Plugin::Core
    \inmodule Eye
    \brief The Core namespace contains the editor widgets, the windows and
    the script engine running the user configuration.
*/

/*!
    \class Eye::Plugin::Core::ICore
    \inheaderfile core/core-interface.hpp
    \inmodule Eye

    \brief The ICore class allows access to the different parts that make up
    the basic functionality of Eye.

    You should never create a subclass of this interface. The one and only
    instance is created by the Core plugin. You can access this instance
    from your plugin through instance().
*/

/*!
    \fn void Eye::Plugin::Core::ICore::coreOpened()

    Emitted once the startup scripts ran, before the files given on the
    command line are opened.
*/

/*!
    \fn void Eye::Plugin::Core::ICore::coreAboutToClose()

    Enables plugins to perform some pre-end-of-life actions.

    The application is guaranteed to shut down after this signal is emitted.
*/

using namespace ExtensionSystem;

namespace Eye::Plugin::Core {

static ICore *m_instance = nullptr;
static QString m_config_path;

/*!
    Returns the pointer to the instance. Only use for connecting to signals.
*/
auto ICore::instance() -> ICore*
{
  return m_instance;
}

ICore::ICore(ScriptEngine *script_engine) : m_script_engine(script_engine)
{
  m_instance = this;
}

ICore::~ICore()
{
  m_instance = nullptr;
}

static auto pathHelper(const QString &rel) -> QString
{
  if (rel.isEmpty())
    return rel;

  if (rel.startsWith('/'))
    return rel;

  return '/' + rel;
}

/*!
    Returns the absolute path for the relative path \a rel in the user
    configuration directory, \c $XDG_CONFIG_HOME/eyeditor unless overridden
    with setConfigPath(). The configuration directory is created if needed.
*/
auto ICore::configPath(const QString &rel) -> QString
{
  auto base = m_config_path;
  if (base.isEmpty())
    base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + '/' + QLatin1String(Constants::IDE_ID);

  if (!QFileInfo::exists(base + QLatin1Char('/'))) {
    if (const QDir dir; !dir.mkpath(base))
      qWarning() << "could not create" << base;
  }

  return QDir::cleanPath(base + pathHelper(rel));
}

/*!
    Uses \a path instead of the default configuration directory.
*/
auto ICore::setConfigPath(const QString &path) -> void
{
  m_config_path = path.isEmpty() ? path : QDir(path).absolutePath();
}

auto ICore::startupScriptsPath() -> QString
{
  return configPath(QLatin1String(Constants::STARTUP_DIR));
}

/*!
    Returns the application's main settings object, \c eye.ini in the
    configuration directory.
*/
auto ICore::settings() -> QSettings*
{
  return PluginManager::settings();
}

auto ICore::scriptEngine() -> ScriptEngine*
{
  QTC_ASSERT(m_instance, return nullptr);
  return m_instance->m_script_engine;
}

/*!
    Creates a new top level window with the default menu bar, holding one
    empty editor. Closing the window deletes it.
*/
auto ICore::createWindow() -> Window*
{
  const auto window = new Window;
  window->setAttribute(Qt::WA_DeleteOnClose);
  window->createDefaultMenuBar();
  QObject::connect(window, &Window::quitRequested, qApp, &QApplication::closeAllWindows, Qt::QueuedConnection);
  if (m_instance)
    emit m_instance->windowCreated(window);
  return window;
}

auto ICore::windows() -> QList<Window*>
{
  return categoryObjects<Window>({QLatin1String(Constants::C_WINDOW)});
}

} // namespace Eye::Plugin::Core
