// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace QuickWheel {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "quickwheel.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcFolder, "quickwheel.core.folder", QtInfoMsg)
Q_LOGGING_CATEGORY(lcNavigation, "quickwheel.core.navigation", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "quickwheel.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcWheel, "quickwheel.daemon.wheel", QtInfoMsg)
Q_LOGGING_CATEGORY(lcShortcuts, "quickwheel.daemon.shortcuts", QtInfoMsg)
Q_LOGGING_CATEGORY(lcExecutor, "quickwheel.daemon.executor", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "quickwheel.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "quickwheel.config", QtInfoMsg)

} // namespace QuickWheel
