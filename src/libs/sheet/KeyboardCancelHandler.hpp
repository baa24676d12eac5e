// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "sheet/SheetGlobal.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QObject>
#include <QtCore/QPointer>

QT_BEGIN_NAMESPACE
class QKeyEvent;
QT_END_NAMESPACE

namespace Sheet {

// Application-wide listener for the platform's dismiss key. The filter is
// installed by the constructor and removed by the destructor, so the
// registration lives exactly as long as the object.
class SHEET_EXPORT KeyboardCancelHandler final : public QObject
{
    Q_OBJECT

public:
    explicit KeyboardCancelHandler(QObject* parent = nullptr);
    ~KeyboardCancelHandler() override;

    bool isListening() const noexcept { return !m_app.isNull(); }

    static bool isCancelKey(const QKeyEvent* event);

signals:
    void cancelRequested();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QPointer<QCoreApplication> m_app;
};

} // namespace Sheet
