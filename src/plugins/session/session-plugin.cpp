// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "session-plugin.hpp"

#include "session-serializer.hpp"

#include <core/core-constants.hpp>
#include <core/core-editor.hpp>
#include <core/core-interface.hpp>
#include <core/core-splitter.hpp>
#include <core/core-tab-widget.hpp>
#include <core/core-window.hpp>

#include <extensionsystem/connector.hpp>

#include <QFileInfo>

/*!
    \class Eye::Plugin::Session::SessionPlugin
    \inheaderfile session/session-plugin.hpp
    \inmodule Eye

    \brief The SessionPlugin class saves the open windows, their splits and
    their tabs to \c last.session in the configuration directory, and
    restores them at the next start.

    The session is saved when a window asks to quit, or when the last
    visible window is being closed. It is restored once the startup scripts
    ran, so a script enabling the plugin gets the session back. Restored
    windows replace the windows that still hold a single untitled, unmodified
    editor.
*/

using namespace Eye::Plugin::Core;

namespace Eye::Plugin::Session {

SessionPlugin::SessionPlugin() = default;

SessionPlugin::~SessionPlugin() = default;

auto SessionPlugin::sessionPath() -> QString
{
  return ICore::configPath(QLatin1String(Constants::SESSION_FILE_NAME));
}

auto SessionPlugin::initialize(const QStringList &arguments, QString *error_message) -> bool
{
  Q_UNUSED(arguments)
  Q_UNUSED(error_message)

  const QStringList windows{QLatin1String(Constants::C_WINDOW)};
  addListener(ExtensionSystem::registerSignal(windows, QLatin1String("quitRequested"), [this](QObject *, const QVariantList &) {
    m_quitting = true;
    save();
  }, QLatin1String("saveSessionOnQuit")));

  addListener(ExtensionSystem::registerEventFilter(windows, {QEvent::Close}, [this](QObject *window, QEvent *) {
    onLastWindowClosing(window);
    return false;
  }, QLatin1String("saveSessionOnLastClose")));
  return true;
}

auto SessionPlugin::extensionsInitialized() -> void
{
  connect(ICore::instance(), &ICore::coreOpened, this, [this] {
    if (isEnabled())
      restore();
  });
}

auto SessionPlugin::onLastWindowClosing(QObject *window) -> void
{
  if (m_quitting)
    return;

  for (const auto other : ICore::windows()) {
    if (other != window && other->isVisible())
      return;
  }
  save();
}

auto SessionPlugin::save() -> bool
{
  QString error;
  if (!saveSession(sessionPath(), &error)) {
    qCWarning(sessionLog).noquote() << error;
    return false;
  }
  return true;
}

static auto isPristine(const Window *window) -> bool
{
  const auto children = window->splitManager()->allChildren();
  if (children.size() != 1)
    return false;
  const auto tabs = qobject_cast<TabWidget*>(children.constFirst());
  if (!tabs || tabs->count() != 1)
    return false;
  const auto editor = tabs->currentBuffer();
  return editor && editor->path().isEmpty() && !editor->isModified();
}

/*!
    Restores the saved session, if any, and returns the created windows.
*/
auto SessionPlugin::restore() -> QList<Window*>
{
  const auto path = sessionPath();
  if (!QFileInfo::exists(path))
    return {};

  QList<Window*> pristine;
  for (const auto window : ICore::windows()) {
    if (isPristine(window))
      pristine.append(window);
  }

  QString error;
  const auto windows = restoreSession(path, &error);
  if (!error.isEmpty())
    qCWarning(sessionLog).noquote() << error;

  if (!windows.isEmpty()) {
    for (const auto window : qAsConst(pristine))
      window->close();
  }
  return windows;
}

} // namespace Eye::Plugin::Session
