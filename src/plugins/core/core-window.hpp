// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "core-global.hpp"

#include <extensionsystem/categorymixin.hpp>

#include <QMainWindow>
#include <QPointer>

namespace Eye::Plugin::Core {

class Editor;
class SplitManager;

class CORE_EXPORT Window : public QMainWindow, public ExtensionSystem::CategoryMixin {
  Q_OBJECT

public:
  explicit Window(QWidget *parent = nullptr);
  ~Window() override;

  auto splitManager() const -> Q_INVOKABLE Eye::Plugin::Core::SplitManager* { return m_split_manager; }
  auto currentBuffer() const -> Q_INVOKABLE Eye::Plugin::Core::Editor*;
  auto createDefaultMenuBar() -> void;

public slots:
  auto bufferNew() -> Eye::Plugin::Core::Editor*;
  auto bufferOpen(const QString &path) -> Eye::Plugin::Core::Editor*;
  auto bufferOpenDialog() -> void;
  auto bufferSave() -> bool;
  auto bufferSaveAs() -> bool;
  auto bufferClose() -> bool;
  auto requestClose() -> bool;

signals:
  auto quitRequested() -> void;

protected:
  auto closeEvent(QCloseEvent *event) -> void override;
  virtual auto askOpenPath() -> QString;

private:
  auto onFocusChanged(QWidget *old, QWidget *now) -> void;

  SplitManager *m_split_manager;
  QPointer<Editor> m_last_focus;
};

} // namespace Eye::Plugin::Core
