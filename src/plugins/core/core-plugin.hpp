// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <extensionsystem/iplugin.hpp>

#include <memory>

namespace Eye::Plugin::Core {

class ICore;
class ScriptEngine;

class CORE_EXPORT CorePlugin final : public ExtensionSystem::IPlugin {
  Q_OBJECT

public:
  CorePlugin();
  ~CorePlugin() override;

  static auto instance() -> CorePlugin*;

  auto initialize(const QStringList &arguments, QString *error_message) -> bool override;
  auto extensionsInitialized() -> void override;
  auto aboutToShutdown() -> void override;

  auto runStartupScripts() const -> int;

private:
  static auto registerBuiltinListeners() -> void;

  std::unique_ptr<ScriptEngine> m_script_engine;
  ICore *m_core = nullptr;
};

} // namespace Eye::Plugin::Core
