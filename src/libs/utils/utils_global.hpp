// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include <qglobal.h>

#if defined(UTILS_LIBRARY)
#  define EYE_UTILS_EXPORT Q_DECL_EXPORT
#elif defined(EYE_UTILS_STATIC_LIB)
#  define EYE_UTILS_EXPORT
#else
#  define EYE_UTILS_EXPORT Q_DECL_IMPORT
#endif
