// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "core-plugin.hpp"

#include "core-constants.hpp"
#include "core-editor.hpp"
#include "core-interface.hpp"
#include "core-script-engine.hpp"

#include <extensionsystem/connector.hpp>

#include <utils/qtcassert.hpp>
#include <utils/savefile.hpp>

#include <QWheelEvent>

/*!
    \class Eye::Plugin::Core::CorePlugin
    \inheaderfile core/core-plugin.hpp
    \inmodule Eye

    \brief The CorePlugin class owns the script engine and the ICore
    instance. It is required and cannot be disabled.

    The built-in listeners it registers are disabled until a script enables
    them:

    \table
    \header
        \li Name
        \li Effect
    \row
        \li \c zoomOnWheel
        \li Ctrl and the mouse wheel zoom the editor in and out.
    \endtable
*/

namespace Eye::Plugin::Core {

static CorePlugin *m_instance = nullptr;

CorePlugin::CorePlugin()
{
  m_instance = this;
}

CorePlugin::~CorePlugin()
{
  delete m_core;
  m_core = nullptr;
  m_script_engine.reset();
  m_instance = nullptr;
}

auto CorePlugin::instance() -> CorePlugin*
{
  return m_instance;
}

auto CorePlugin::initialize(const QStringList &arguments, QString *error_message) -> bool
{
  Q_UNUSED(arguments)
  Q_UNUSED(error_message)

  Utils::SaveFile::initializeUmask();
  m_script_engine = std::make_unique<ScriptEngine>();
  m_core = new ICore(m_script_engine.get());
  registerBuiltinListeners();
  return true;
}

auto CorePlugin::extensionsInitialized() -> void {}

auto CorePlugin::aboutToShutdown() -> void
{
  if (m_core)
    emit m_core->coreAboutToClose();
}

/*!
    Runs the scripts of the startup directory, then emits
    ICore::coreOpened(). Returns the number of scripts that ran without
    error.
*/
auto CorePlugin::runStartupScripts() const -> int
{
  QTC_ASSERT(m_script_engine && m_core, return 0);
  const auto succeeded = m_script_engine->runStartupScripts(ICore::startupScriptsPath());
  emit m_core->coreOpened();
  return succeeded;
}

auto CorePlugin::registerBuiltinListeners() -> void
{
  const auto zoom = ExtensionSystem::registerEventFilter({QLatin1String(Constants::C_EDITOR)}, {QEvent::Wheel}, [](QObject *object, QEvent *event) {
    const auto editor = qobject_cast<Editor*>(object);
    const auto wheel = static_cast<QWheelEvent*>(event);
    if (!editor || !(wheel->modifiers() & Qt::ControlModifier))
      return false;

    const auto delta = wheel->angleDelta().y();
    if (delta > 0)
      editor->zoomIn();
    else if (delta < 0)
      editor->zoomOut();
    return true;
  }, QLatin1String(Constants::L_ZOOM_ON_WHEEL));

  if (zoom)
    zoom->setEnabled(false);
}

} // namespace Eye::Plugin::Core
