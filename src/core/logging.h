// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for QuickWheel
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcNavigation) << "Hover changed";
 *   qCWarning(lcFolder) << "Unknown folder id";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="quickwheel.*=true"                  # Enable all
 *   QT_LOGGING_RULES="quickwheel.*.debug=false"           # Disable debug only
 *   QT_LOGGING_RULES="quickwheel.core.navigation=true"    # Dwell tracing only
 *
 * Severity Guidelines:
 *   qCDebug    - Per-tick tracing (hover, dwell arm/cancel)
 *   qCInfo     - Significant operational events (activation, navigation, folder created)
 *   qCWarning  - Recoverable errors (dangling folder id, load failure, rejected edit)
 *   qCCritical - System failures preventing normal operation
 */

namespace QuickWheel {

// Core module - folder graph, hit-testing, dwell navigation
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcFolder)
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcNavigation)

// Daemon module - activation, shortcuts, action execution
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcWheel)
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcShortcuts)
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcExecutor)

// D-Bus module
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings and wheel.json
QUICKWHEEL_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace QuickWheel
