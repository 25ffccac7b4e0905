// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#include <core/core-buffers.hpp>
#include <core/core-constants.hpp>
#include <core/core-interface.hpp>
#include <core/core-plugin.hpp>
#include <core/core-window.hpp>

#include <filemonitor/filemonitor-plugin.hpp>
#include <navhistory/navhistory-plugin.hpp>
#include <session/session-plugin.hpp>

#include <extensionsystem/pluginmanager.hpp>
#include <extensionsystem/pluginspec.hpp>

#include <utils/link.hpp>

#include <QApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

using namespace ExtensionSystem;
using namespace Eye::Plugin;

constexpr char fixed_options_c[] =
" [OPTION]... [FILE[:LINE[:COL]]]...\n"
"Options:\n"
"    -help                         Display this help\n"
"    -version                      Display program version\n"
"    -debug                        Enable the debug output of all categories\n"
"    -configpath <path>            Override the default configuration directory\n"
"    -settingspath <path>          Override the default path where user settings are stored\n";
constexpr char help_option1[] = "-h";
constexpr char help_option2[] = "-help";
constexpr char help_option3[] = "--help";
constexpr char version_option[] = "-version";
constexpr char debug_option[] = "-debug";
constexpr char config_option[] = "-configpath";
constexpr char settings_option[] = "-settingspath";

static auto displayHelpText(const QString &t) -> void
{
  qWarning("%s", qPrintable(t));
}

static auto displayError(const QString &t) -> void
{
  qCritical("%s", qPrintable(t));
}

static auto printVersion() -> void
{
  QString version;
  QTextStream str(&version);
  str << '\n' << Core::Constants::IDE_DISPLAY_NAME << ' ' << Core::Constants::IDE_VERSION_LONG << " based on Qt " << qVersion() << "\n\n";
  for (const auto spec : PluginManager::plugins())
    str << "  " << spec->name() << (spec->isEnabled() ? "" : " (disabled)") << '\n';
  displayHelpText(version);
}

static auto printHelp(const QString &a0) -> void
{
  QString help;
  QTextStream str(&help);
  str << "Usage: " << a0 << fixed_options_c;
  displayHelpText(help);
}

struct Options {
  QString config_path;
  QString settings_path;
  QStringList files;
  // list of arguments to be passed to the plugin manager
  QStringList plugin_arguments;
  bool help = false;
  bool version = false;
  bool debug = false;
  QString error;
};

auto parseCommandLine(const QStringList &arguments) -> Options
{
  Options options;
  for (auto it = arguments.cbegin() + 1; it < arguments.cend(); ++it) {
    const auto &arg = *it;
    const auto has_next = it + 1 != arguments.cend();
    const auto next_arg = has_next ? *(it + 1) : QString();

    if (arg == help_option1 || arg == help_option2 || arg == help_option3) {
      options.help = true;
    } else if (arg == version_option) {
      options.version = true;
    } else if (arg == debug_option) {
      options.debug = true;
    } else if (arg == config_option || arg == settings_option) {
      if (!has_next) {
        options.error = QCoreApplication::translate("Application", "The option %1 requires an argument.").arg(arg);
        return options;
      }
      ++it;
      if (arg == config_option)
        options.config_path = QDir::fromNativeSeparators(next_arg);
      else
        options.settings_path = QDir::fromNativeSeparators(next_arg);
    } else if (arg.startsWith(QLatin1Char('-')) && arg.size() > 1) {
      // unknown options are left to the plugins
      options.plugin_arguments << arg;
    } else {
      options.files << arg;
    }
  }
  return options;
}

static auto registerPlugins() -> void
{
  PluginManager::addPlugin(new Core::CorePlugin, QLatin1String(Core::Constants::CORE_PLUGIN), QCoreApplication::translate("Application", "Editor windows and startup scripts"), PluginManager::Required);
  PluginManager::addPlugin(new NavHistory::NavHistoryPlugin, QLatin1String("NavHistory"), QCoreApplication::translate("Application", "Jump back to previous cursor positions"));
  PluginManager::addPlugin(new FileMonitor::FileMonitorPlugin, QLatin1String("FileMonitor"), QCoreApplication::translate("Application", "Notice files modified outside of the editor"));
  PluginManager::addPlugin(new Session::SessionPlugin, QLatin1String("Session"), QCoreApplication::translate("Application", "Save and restore the open windows"));
}

static auto openFiles(const QStringList &files) -> void
{
  for (const auto &file : files) {
    const auto link = Utils::Link::fromString(file);
    if (!Core::Buffers::openEditor(link.target_file_path, link.target_line, link.target_column))
      displayError(QCoreApplication::translate("Application", "Could not open \"%1\".").arg(link.target_file_path));
  }
}

auto main(int argc, char **argv) -> int
{
  QApplication app(argc, argv);
  QCoreApplication::setApplicationName(QLatin1String(Core::Constants::IDE_ID));
  QCoreApplication::setApplicationVersion(QLatin1String(Core::Constants::IDE_VERSION_LONG));
  QGuiApplication::setApplicationDisplayName(QLatin1String(Core::Constants::IDE_DISPLAY_NAME));

  const auto options = parseCommandLine(QCoreApplication::arguments());
  const auto app_name = QFileInfo(QCoreApplication::applicationFilePath()).baseName();
  if (!options.error.isEmpty()) {
    displayError(options.error);
    printHelp(app_name);
    return -1;
  }
  if (options.help) {
    printHelp(app_name);
    return 0;
  }

  if (options.debug)
    QLoggingCategory::setFilterRules(QLatin1String("eye.*.debug=true"));

  if (!options.config_path.isEmpty())
    Core::ICore::setConfigPath(options.config_path);

  const auto settings_dir = options.settings_path.isEmpty() ? Core::ICore::configPath() : options.settings_path;
  // plugin manager takes control of this settings object
  const auto settings = new QSettings(QDir(settings_dir).filePath(QLatin1String(Core::Constants::SETTINGS_FILE_NAME)), QSettings::IniFormat);

  PluginManager plugin_manager;
  PluginManager::setSettings(settings);
  PluginManager::setArguments(options.plugin_arguments);
  registerPlugins();
  PluginManager::loadPlugins();

  if (const auto core = PluginManager::pluginByName(QLatin1String(Core::Constants::CORE_PLUGIN)); !core || core->hasError()) {
    displayError(QCoreApplication::translate("Application", "Failed to load core: %1").arg(core ? core->errorString() : QString()));
    return 1;
  }
  for (const auto &error : PluginManager::allErrors())
    displayError(error);

  if (options.version) {
    printVersion();
    PluginManager::shutdown();
    return 0;
  }

  Core::ICore::createWindow()->show();

  const auto succeeded = Core::CorePlugin::instance()->runStartupScripts();
  qCDebug(scriptsLog) << succeeded << "startup scripts ran";

  openFiles(options.files);

  const auto result = QApplication::exec();

  PluginManager::writeSettings();
  PluginManager::shutdown();
  return result;
}
