// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "actionexecutor.h"
#include "../core/logging.h"
#include <QKeySequence>
#include <QProcess>

namespace QuickWheel {

ProcessActionExecutor::ProcessActionExecutor(IKeystrokeInjector* injector)
    : m_injector(injector)
{
}

ProcessActionExecutor::~ProcessActionExecutor() = default;

QKeySequence ProcessActionExecutor::parseKeySequence(const QString& text)
{
    // Normalize "ctrl+shift+t" and "Super+E" to Qt's portable spelling
    QStringList parts = text.split(QLatin1Char('+'), Qt::SkipEmptyParts);
    for (QString& part : parts) {
        part = part.trimmed();
        const QString lower = part.toLower();
        if (lower == QLatin1String("ctrl") || lower == QLatin1String("control")) {
            part = QStringLiteral("Ctrl");
        } else if (lower == QLatin1String("super") || lower == QLatin1String("meta") || lower == QLatin1String("cmd")) {
            part = QStringLiteral("Meta");
        } else if (lower == QLatin1String("alt")) {
            part = QStringLiteral("Alt");
        } else if (lower == QLatin1String("shift")) {
            part = QStringLiteral("Shift");
        } else if (part.size() == 1) {
            part = part.toUpper();
        }
    }

    const QKeySequence sequence = QKeySequence::fromString(parts.join(QLatin1Char('+')), QKeySequence::PortableText);
    if (sequence.count() != 1 || sequence[0].key() == Qt::Key_unknown) {
        return QKeySequence();
    }
    return sequence;
}

bool ProcessActionExecutor::startDetached(const QString& program, const QStringList& arguments)
{
    QProcess process;
    process.setProgram(program);
    process.setArguments(arguments);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = 0;
    if (!process.startDetached(&pid)) {
        qCWarning(lcExecutor) << "Failed to start" << program << arguments << "Error:" << process.errorString();
        return false;
    }
    qCDebug(lcExecutor) << "Started" << program << "pid=" << pid;
    return true;
}

bool ProcessActionExecutor::execute(ActionType type, const QString& value)
{
    if (value.trimmed().isEmpty()) {
        qCWarning(lcExecutor) << "Refusing to execute" << actionTypeToString(type) << "with empty value";
        return false;
    }

    switch (type) {
    case ActionType::Command:
        qCInfo(lcExecutor) << "Running command" << value;
        return startDetached(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), value});

    case ActionType::Launch:
        qCInfo(lcExecutor) << "Launching" << value;
        return startDetached(value, {});

    case ActionType::Keystroke: {
        const QKeySequence sequence = parseKeySequence(value);
        if (sequence.isEmpty()) {
            qCWarning(lcExecutor) << "Invalid key sequence:" << value;
            return false;
        }
        if (!m_injector) {
            qCWarning(lcExecutor) << "No keystroke backend available, dropping" << sequence.toString();
            return false;
        }
        qCInfo(lcExecutor) << "Sending keystroke" << sequence.toString();
        return m_injector->sendKeySequence(sequence);
    }

    case ActionType::None:
    case ActionType::Folder:
    case ActionType::Back:
        break;
    }

    qCWarning(lcExecutor) << "Action type" << actionTypeToString(type) << "is not executable";
    return false;
}

} // namespace QuickWheel
