// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "sheet/KeyboardCancelHandler.hpp"

#include <QtCore/QEvent>
#include <QtGui/QKeyEvent>
#include <QtGui/QKeySequence>

namespace Sheet {

KeyboardCancelHandler::KeyboardCancelHandler(QObject* parent)
    : QObject(parent)
    , m_app(QCoreApplication::instance())
{
    if (m_app) {
        m_app->installEventFilter(this);
        qCDebug(sheetlog) << "cancel key listener installed";
    } else {
        qCWarning(sheetlog) << "no application instance; cancel key listener not installed";
    }
}

KeyboardCancelHandler::~KeyboardCancelHandler()
{
    if (m_app) {
        m_app->removeEventFilter(this);
        qCDebug(sheetlog) << "cancel key listener removed";
    }
}

bool KeyboardCancelHandler::isCancelKey(const QKeyEvent* event)
{
    if (!event)
        return false;
    return event->matches(QKeySequence::Cancel) || event->key() == Qt::Key_Back;
}

bool KeyboardCancelHandler::eventFilter(QObject* watched, QEvent* event)
{
    // An application filter sees a key event once for every receiver it
    // propagates through. Count it only when it reaches the window.
    if (event->type() == QEvent::KeyPress && watched && watched->isWindowType()) {
        if (isCancelKey(static_cast<QKeyEvent*>(event)))
            emit cancelRequested();
    }

    return QObject::eventFilter(watched, event);
}

} // namespace Sheet
