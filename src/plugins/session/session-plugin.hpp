// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "session-global.hpp"

#include <extensionsystem/iplugin.hpp>

namespace Eye::Plugin::Core {
class Window;
} // namespace Eye::Plugin::Core

namespace Eye::Plugin::Session {

class SESSION_EXPORT SessionPlugin final : public ExtensionSystem::IPlugin {
  Q_OBJECT

public:
  SessionPlugin();
  ~SessionPlugin() override;

  static auto sessionPath() -> QString;

  auto initialize(const QStringList &arguments, QString *error_message) -> bool override;
  auto extensionsInitialized() -> void override;

  auto save() -> bool;
  auto restore() -> QList<Core::Window*>;

private:
  auto onLastWindowClosing(QObject *window) -> void;

  bool m_quitting = false;
};

} // namespace Eye::Plugin::Session
