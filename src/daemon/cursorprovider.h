// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QCursor>

namespace QuickWheel {

/**
 * @brief Global pointer position from QCursor
 */
class QCursorProvider : public ICursorProvider
{
public:
    QPoint cursorPos() const override { return QCursor::pos(); }
};

} // namespace QuickWheel
