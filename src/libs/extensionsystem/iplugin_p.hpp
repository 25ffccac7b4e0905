// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "iplugin.hpp"
#include "listener.hpp"

#include <QPointer>

namespace ExtensionSystem {

class PluginSpec;

namespace Internal {

class IPluginPrivate {
public:
  PluginSpec *plugin_spec = nullptr;
  QList<QPointer<Listener>> listeners;
  bool enabled = false;
};

} // namespace Internal
} // namespace ExtensionSystem
