// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "quickwheel_export.h"
#include "../core/interfaces.h"
#include <QStringList>

class QKeySequence;

namespace QuickWheel {

/**
 * @brief Runs committed actions as detached processes
 *
 * - command: run through /bin/sh -c, stdio to /dev/null, own session
 * - launch: the program path started directly, no arguments
 * - keystroke: parsed as a portable key sequence and handed to the
 *   keystroke injector; rejected when none is installed
 */
class QUICKWHEEL_EXPORT ProcessActionExecutor : public IActionExecutor
{
public:
    explicit ProcessActionExecutor(IKeystrokeInjector* injector = nullptr);
    ~ProcessActionExecutor() override;

    bool execute(ActionType type, const QString& value) override;

    void setKeystrokeInjector(IKeystrokeInjector* injector) { m_injector = injector; }

    /**
     * @brief Parse "Ctrl+Shift+T" style text, case-insensitively
     * @return Empty sequence if the text is not a single valid chord
     */
    static QKeySequence parseKeySequence(const QString& text);

private:
    bool startDetached(const QString& program, const QStringList& arguments);

    IKeystrokeInjector* m_injector = nullptr;
};

} // namespace QuickWheel
