// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include "session-serializer.hpp"

#include <core/core-constants.hpp>
#include <core/core-editor.hpp>
#include <core/core-interface.hpp>
#include <core/core-splitter.hpp>
#include <core/core-tab-widget.hpp>
#include <core/core-window.hpp>

#include <extensionsystem/connector.hpp>

#include <utils/fileutils.hpp>
#include <utils/qtcassert.hpp>

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>

Q_LOGGING_CATEGORY(sessionLog, "eye.session", QtWarningMsg)

using namespace Eye::Plugin::Core;

namespace Eye::Plugin::Session {

static constexpr char type_key[] = "type";
static constexpr char items_key[] = "items";
static constexpr char geometry_key[] = "qgeometry";
static constexpr char state_key[] = "qstate";

static auto toHex(const QByteArray &data) -> QString
{
  return QString::fromLatin1(data.toHex());
}

static auto fromHex(const QJsonValue &value) -> QByteArray
{
  return QByteArray::fromHex(value.toString().toLatin1());
}

auto SessionSerializer::serializeSession() -> QJsonObject
{
  QJsonArray windows;
  for (const auto window : ExtensionSystem::categoryObjects<Window>({QLatin1String(Constants::C_WINDOW)}))
    windows.append(serializeWindow(window));
  return {{QLatin1String("windows"), windows}};
}

auto SessionSerializer::serializeWindow(const Window *window) -> QJsonObject
{
  QTC_ASSERT(window, return {});
  return {
    {QLatin1String(type_key), QLatin1String("window")},
    {QLatin1String(geometry_key), toHex(window->saveGeometry())},
    {QLatin1String(state_key), toHex(window->saveState())},
    {QLatin1String("splitter"), serializeSplitter(window->splitManager()->root())},
  };
}

auto SessionSerializer::serializeSplitter(const Splitter *splitter) -> QJsonObject
{
  QTC_ASSERT(splitter, return {});

  QJsonArray items;
  for (auto i = 0; i < splitter->count(); ++i) {
    const auto widget = splitter->widget(i);
    if (const auto child = qobject_cast<const Splitter*>(widget))
      items.append(serializeSplitter(child));
    else if (const auto tabs = qobject_cast<const TabWidget*>(widget))
      items.append(serializeTabs(tabs));
  }

  return {
    {QLatin1String(type_key), QLatin1String("splitter")},
    {QLatin1String("orientation"), static_cast<int>(splitter->orientation())},
    {QLatin1String(state_key), toHex(splitter->saveState())},
    {QLatin1String(items_key), items},
  };
}

auto SessionSerializer::serializeTabs(const TabWidget *tabs) -> QJsonObject
{
  QTC_ASSERT(tabs, return {});

  QJsonArray items;
  for (const auto editor : tabs->editors())
    items.append(serializeEditor(editor));

  return {
    {QLatin1String(type_key), QLatin1String("tabwidget")},
    {QLatin1String(items_key), items},
    {QLatin1String("current"), tabs->currentIndex()},
  };
}

auto SessionSerializer::serializeEditor(const Editor *editor) -> QJsonObject
{
  QTC_ASSERT(editor, return {});
  return {
    {QLatin1String(type_key), QLatin1String("editor")},
    {QLatin1String("path"), editor->path()},
    {QLatin1String("cursor"), QJsonArray{editor->cursorLine(), editor->cursorColumn()}},
  };
}

/*!
    Creates the windows described by \a session and returns them. A session
    without a \c windows array sets \a error_string and creates nothing.
*/
auto SessionSerializer::restoreSession(const QJsonObject &session, QString *error_string) -> QList<Window*>
{
  const auto windows = session.value(QLatin1String("windows"));
  if (!windows.isArray()) {
    if (error_string)
      *error_string = QCoreApplication::translate("Session::SessionSerializer", "The session has no windows.");
    return {};
  }

  QList<Window*> result;
  for (const auto &data : windows.toArray()) {
    if (const auto window = restoreWindow(data.toObject()))
      result.append(window);
  }
  return result;
}

auto SessionSerializer::restoreWindow(const QJsonObject &data) -> Window*
{
  if (data.value(QLatin1String(type_key)).toString() != QLatin1String("window"))
    return nullptr;

  const auto window = ICore::createWindow();
  // Geometry may not apply to a maximized window on another screen.
  window->showNormal();

  if (data.contains(QLatin1String(geometry_key)))
    window->restoreGeometry(fromHex(data.value(QLatin1String(geometry_key))));
  if (data.contains(QLatin1String(state_key)))
    window->restoreState(fromHex(data.value(QLatin1String(state_key))));

  const auto splitter = data.value(QLatin1String("splitter")).toObject();
  const auto root = window->splitManager()->root();
  const auto initial = root->widget(0);
  restoreSplitter(splitter, root);

  if (initial && root->count() > 1) {
    initial->hide();
    initial->setParent(nullptr);
    initial->deleteLater();
  }
  resizeSplitter(splitter, root);
  return window;
}

auto SessionSerializer::restoreSplitter(const QJsonObject &data, Splitter *splitter) -> void
{
  if (data.value(QLatin1String(type_key)).toString() != QLatin1String("splitter"))
    return;

  const auto orientation = static_cast<Qt::Orientation>(data.value(QLatin1String("orientation")).toInt(Qt::Horizontal));
  splitter->setOrientation(orientation);

  for (const auto &value : data.value(QLatin1String(items_key)).toArray()) {
    const auto item = value.toObject();
    const auto type = item.value(QLatin1String(type_key)).toString();
    if (type == QLatin1String("splitter")) {
      const auto child = new Splitter(Qt::Horizontal);
      splitter->addWidget(child);
      restoreSplitter(item, child);
    } else if (type == QLatin1String("tabwidget")) {
      const auto tabs = new TabWidget;
      splitter->addWidget(tabs);
      restoreTabs(item, tabs);
    }
  }
}

auto SessionSerializer::resizeSplitter(const QJsonObject &data, Splitter *splitter) -> void
{
  if (data.contains(QLatin1String(state_key)))
    splitter->restoreState(fromHex(data.value(QLatin1String(state_key))));

  const auto items = data.value(QLatin1String(items_key)).toArray();
  for (auto i = 0; i < items.size() && i < splitter->count(); ++i) {
    if (const auto child = qobject_cast<Splitter*>(splitter->widget(i)))
      resizeSplitter(items.at(i).toObject(), child);
  }
}

auto SessionSerializer::restoreTabs(const QJsonObject &data, TabWidget *tabs) -> void
{
  for (const auto &value : data.value(QLatin1String(items_key)).toArray())
    restoreEditor(value.toObject(), tabs);
  tabs->setCurrentIndex(data.value(QLatin1String("current")).toInt(0));
}

auto SessionSerializer::restoreEditor(const QJsonObject &data, TabWidget *tabs) -> void
{
  if (data.value(QLatin1String(type_key)).toString() != QLatin1String("editor"))
    return;

  const auto editor = new Editor;
  tabs->addEditor(editor);

  const auto path = data.value(QLatin1String("path")).toString();
  if (!path.isEmpty() && !editor->openFile(path))
    qCWarning(sessionLog) << "could not reopen" << path;

  const auto cursor = data.value(QLatin1String("cursor")).toArray();
  if (cursor.size() == 2)
    editor->goto1(cursor.at(0).toInt() + 1, cursor.at(1).toInt() + 1);
}

/*!
    Writes the current session to \a path.
*/
auto saveSession(const QString &path, QString *error_string) -> bool
{
  Utils::FileSaver saver(path, QIODevice::Text);
  saver.write(QJsonDocument(SessionSerializer::serializeSession()).toJson());
  if (!saver.finalize(error_string))
    return false;
  qCDebug(sessionLog) << "session saved to" << path;
  return true;
}

/*!
    Restores the session written to \a path. Returns the created windows,
    none if the file cannot be read or parsed.
*/
auto restoreSession(const QString &path, QString *error_string) -> QList<Window*>
{
  Utils::FileReader reader;
  if (!reader.fetch(path, error_string))
    return {};

  QJsonParseError parse_error;
  const auto document = QJsonDocument::fromJson(reader.data(), &parse_error);
  if (parse_error.error != QJsonParseError::NoError || !document.isObject()) {
    if (error_string)
      *error_string = QCoreApplication::translate("Session::SessionSerializer", "Cannot parse \"%1\": %2").arg(path, parse_error.errorString());
    return {};
  }

  qCDebug(sessionLog) << "restoring session from" << path;
  return SessionSerializer::restoreSession(document.object(), error_string);
}

} // namespace Eye::Plugin::Session
