// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QtGlobal>

namespace Eye::Plugin::Core::Constants {

// Application
constexpr char IDE_DISPLAY_NAME[] = "Eye";
constexpr char IDE_ID[] = "eyeditor";
constexpr char IDE_VERSION_LONG[] = "0.1.0";

// Categories
constexpr char C_EDITOR[] = "editor";
constexpr char C_WINDOW[] = "window";
constexpr char C_TABWIDGET[] = "tabwidget";
constexpr char C_SPLITTER[] = "splitter";
constexpr char C_SPLITMANAGER[] = "splitmanager";

// Pseudo signals
constexpr char S_CONNECTED[] = "connected";

// Built-in listeners
constexpr char L_ZOOM_ON_WHEEL[] = "zoomOnWheel";

// Configuration
constexpr char SETTINGS_FILE_NAME[] = "eye.ini";
constexpr char STARTUP_DIR[] = "startup";
constexpr char SCRIPT_FILTER[] = "*.js";
constexpr char SESSION_FILE_NAME[] = "last.session";

// Plugins
constexpr char CORE_PLUGIN[] = "Core";

// Texts
constexpr char UNTITLED[] = "<untitled>";

} // namespace Eye::Plugin::Core::Constants
