// SPDX-License-Identifier: GPL-3.0-only WITH Qt-GPL-exception-1.0

#pragma once

#include "utils_global.hpp"

namespace Utils {

// Reports a failed soft assertion and continues, unless EYE_FATAL_ASSERTS
// is set in the environment.
EYE_UTILS_EXPORT auto writeAssertLocation(const char *condition, const char *file, int line) -> void;

} // namespace Utils

// 'action' may be 'break' or 'continue', so the block is not wrapped in
// 'do {...} while (0)'.
#define QTC_ASSERT(cond, action) if (Q_LIKELY(cond)) {} else { ::Utils::writeAssertLocation(#cond, __FILE__, __LINE__); action; } do {} while (0)
#define QTC_CHECK(cond) if (Q_LIKELY(cond)) {} else { ::Utils::writeAssertLocation(#cond, __FILE__, __LINE__); } do {} while (0)
#define QTC_GUARD(cond) ((Q_LIKELY(cond)) ? true : (::Utils::writeAssertLocation(#cond, __FILE__, __LINE__), false))
