// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <QLoggingCategory>
#include <qglobal.h>

#if defined(SESSION_LIBRARY)
#  define SESSION_EXPORT Q_DECL_EXPORT
#elif defined(SESSION_STATIC_LIBRARY)
#  define SESSION_EXPORT
#else
#  define SESSION_EXPORT Q_DECL_IMPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(sessionLog)
